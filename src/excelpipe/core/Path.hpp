#pragma once

#include <string>
#include <cstdint>
#include <ostream>

namespace excelpipe {
namespace core {

/**
 * @brief UTF-8路径
 *
 * Windows 下借助 utf8cpp 转成宽字符路径，其他平台直接使用 UTF-8。
 */
class Path {
private:
    std::string utf8_path_;

public:
    Path() = default;
    explicit Path(const std::string& path) : utf8_path_(path) {}
    explicit Path(const char* path) : utf8_path_(path ? path : "") {}

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    bool exists() const;
    bool isFile() const;

    /**
     * @brief 文件大小（字节），失败返回0
     */
    uintmax_t fileSize() const;

    bool remove() const;

    /**
     * @brief 确保父目录存在
     * @return 父目录已存在或创建成功
     */
    bool createParentDirectories() const;

#ifdef _WIN32
    std::wstring getWidePath() const;
#endif

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

} // namespace core
} // namespace excelpipe
