#include "excelpipe/archive/ZipWriter.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>

#include <ctime>
#include <limits>

namespace excelpipe {
namespace archive {

ZipWriter::ZipWriter(const core::Path& path)
    : filepath_(path) {
}

ZipWriter::~ZipWriter() {
    cleanup();
}

bool ZipWriter::open() {
    cleanup();

    zip_handle_ = mz_zip_writer_create();
    if (!zip_handle_) {
        ARCHIVE_ERROR("Failed to create zip writer");
        return false;
    }

    mz_zip_writer_set_compress_method(zip_handle_, MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));

    if (filepath_.exists() && !filepath_.remove()) {
        ARCHIVE_WARN("Could not remove existing file: {}", filepath_.string());
    }

    int32_t result = mz_zip_writer_open_file(zip_handle_, filepath_.c_str(), 0, 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for writing: {}, error: {}", filepath_.string(), result);
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
        return false;
    }

    // 禁用 Data Descriptor，部分 Excel 版本对其兼容性不好
    void* zip_handle = nullptr;
    if (mz_zip_writer_get_zip_handle(zip_handle_, &zip_handle) == MZ_OK && zip_handle) {
        mz_zip_set_data_descriptor(zip_handle, 0);
    }

    is_open_ = true;
    ARCHIVE_DEBUG("ZIP archive opened for writing: {}", filepath_.string());
    return true;
}

bool ZipWriter::close() {
    if (!is_open_ || !zip_handle_) {
        return true;
    }

    bool success = true;
    int32_t result = mz_zip_writer_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to finalize ZIP file: {}, error code: {}", filepath_.string(), result);
        success = false;
    }

    mz_zip_writer_delete(&zip_handle_);
    zip_handle_ = nullptr;
    is_open_ = false;
    written_paths_.clear();
    return success;
}

ZipError ZipWriter::addFile(std::string_view internal_path, std::string_view content) {
    if (!is_open_ || !zip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for writing");
        return ZipError::NotOpen;
    }

    std::string path(internal_path);
    if (path.empty()) {
        return ZipError::InvalidParameter;
    }
    if (written_paths_.count(path) > 0) {
        ARCHIVE_WARN("File {} already exists in zip, skipping duplicate entry", path);
        return ZipError::InvalidParameter;
    }
    if (content.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        ARCHIVE_ERROR("File {} is too large ({} bytes)", path, content.size());
        return ZipError::TooLarge;
    }

    mz_zip_file file_info = {};
    file_info.filename = path.c_str();
    file_info.uncompressed_size = static_cast<int64_t>(content.size());
    file_info.compression_method = compression_level_ == 0 ? MZ_COMPRESS_METHOD_STORE
                                                           : MZ_COMPRESS_METHOD_DEFLATE;
    std::time_t now = std::time(nullptr);
    file_info.modified_date = now;
    file_info.creation_date = now;
    file_info.flag = 0;
#ifdef _WIN32
    file_info.version_madeby = (MZ_HOST_SYSTEM_WINDOWS_NTFS << 8) | 20;
#else
    file_info.version_madeby = (MZ_HOST_SYSTEM_UNIX << 8) | 20;
#endif

    int32_t result = mz_zip_writer_entry_open(zip_handle_, &file_info);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry for file {} in zip, error: {}", path, result);
        return ZipError::IoFail;
    }

    if (!content.empty()) {
        int32_t bytes_written = mz_zip_writer_entry_write(zip_handle_, content.data(),
                                                          static_cast<int32_t>(content.size()));
        if (bytes_written != static_cast<int32_t>(content.size())) {
            ARCHIVE_ERROR("Failed to write complete data for file {} to zip", path);
            mz_zip_writer_entry_close(zip_handle_);
            return ZipError::IoFail;
        }
    }

    result = mz_zip_writer_entry_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to close entry for file {} in zip, error: {}", path, result);
        return ZipError::IoFail;
    }

    written_paths_.insert(path);
    ARCHIVE_DEBUG("Added file {} to zip, size: {} bytes", path, content.size());
    return ZipError::Ok;
}

ZipError ZipWriter::setCompressionLevel(int level) {
    if (level < 0 || level > 9) {
        ARCHIVE_ERROR("Invalid compression level: {}. Valid range: 0 to 9", level);
        return ZipError::InvalidParameter;
    }
    compression_level_ = level;
    if (is_open_ && zip_handle_) {
        mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));
    }
    return ZipError::Ok;
}

void ZipWriter::cleanup() {
    if (is_open_ && zip_handle_) {
        if (!close()) {
            ARCHIVE_ERROR("ZIP file {} was not finalized cleanly", filepath_.string());
        }
    } else if (zip_handle_) {
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
    }
    is_open_ = false;
}

}} // namespace excelpipe::archive
