#pragma once

#include "excelpipe/archive/ZipError.hpp"
#include "excelpipe/core/Path.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace excelpipe {
namespace archive {

/**
 * @brief ZIP读取器（minizip-ng）
 *
 * 打开时建立条目缓存，按内部路径整体解压到内存。
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        bool is_directory = false;
    };

    explicit ZipReader(const core::Path& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * @brief 打开ZIP文件进行读取
     */
    bool open();
    void close();
    bool isOpen() const { return is_open_; }

    std::vector<std::string> listFiles() const;
    bool hasFile(std::string_view internal_path) const;

    /**
     * @brief 提取文件到字符串
     * @param internal_path ZIP内部路径
     * @param content 输出内容
     */
    ZipError extractFile(std::string_view internal_path, std::string& content);

    const core::Path& getPath() const { return filepath_; }

private:
    void cleanup();
    void buildEntryCache();

    void* unzip_handle_ = nullptr;
    core::Path filepath_;
    bool is_open_ = false;
    std::unordered_map<std::string, EntryInfo> entry_cache_;
};

}} // namespace excelpipe::archive
