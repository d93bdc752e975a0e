#pragma once

#include "excelpipe/archive/ZipError.hpp"
#include "excelpipe/core/Path.hpp"

#include <string>
#include <string_view>
#include <unordered_set>

namespace excelpipe {
namespace archive {

/**
 * @brief ZIP写入器（minizip-ng，DEFLATE）
 */
class ZipWriter {
public:
    explicit ZipWriter(const core::Path& path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * @brief 创建ZIP文件（已存在时覆盖）
     */
    bool open();

    /**
     * @brief 写出中央目录并关闭
     * @return 中央目录写入失败时返回 false
     */
    bool close();

    bool isOpen() const { return is_open_; }

    /**
     * @brief 添加一个条目；重复路径会被拒绝
     */
    ZipError addFile(std::string_view internal_path, std::string_view content);

    /**
     * @brief 设置压缩级别（0-9，0 表示仅存储）
     */
    ZipError setCompressionLevel(int level);

private:
    void cleanup();

    void* zip_handle_ = nullptr;
    core::Path filepath_;
    bool is_open_ = false;
    int compression_level_ = 6;
    std::unordered_set<std::string> written_paths_;
};

}} // namespace excelpipe::archive
