#include "excelpipe/core/Path.hpp"
#include "excelpipe/utils/Logger.hpp"

#include <filesystem>
#include <system_error>

#ifdef _WIN32
#include <utf8.h>
#include <iterator>
#endif

namespace excelpipe {
namespace core {

namespace {

std::filesystem::path toNative(const Path& path) {
#ifdef _WIN32
    return std::filesystem::path(path.getWidePath());
#else
    return std::filesystem::path(path.string());
#endif
}

} // namespace

#ifdef _WIN32
std::wstring Path::getWidePath() const {
    std::wstring result;
    if (utf8_path_.empty()) return result;
    try {
        utf8::utf8to16(utf8_path_.begin(), utf8_path_.end(), std::back_inserter(result));
    } catch (const utf8::exception& e) {
        EXCELPIPE_LOG_WARN("Invalid UTF-8 path '{}': {}", utf8_path_, e.what());
        result.assign(utf8_path_.begin(), utf8_path_.end());
    }
    return result;
}
#endif

bool Path::exists() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return std::filesystem::exists(toNative(*this), ec);
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return std::filesystem::is_regular_file(toNative(*this), ec);
}

uintmax_t Path::fileSize() const {
    if (utf8_path_.empty()) return 0;
    std::error_code ec;
    auto size = std::filesystem::file_size(toNative(*this), ec);
    if (ec) {
        EXCELPIPE_LOG_DEBUG("Filesystem error getting file size '{}': {}", utf8_path_, ec.message());
        return 0;
    }
    return size;
}

bool Path::remove() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return std::filesystem::remove(toNative(*this), ec);
}

bool Path::createParentDirectories() const {
    auto parent = toNative(*this).parent_path();
    if (parent.empty()) return true;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        EXCELPIPE_LOG_ERROR("Cannot create directory for '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return true;
}

} // namespace core
} // namespace excelpipe
