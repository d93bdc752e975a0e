#include "excelpipe/archive/ZipReader.hpp"
#include "excelpipe/core/Constants.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>

#include <algorithm>
#include <limits>

namespace excelpipe {
namespace archive {

ZipReader::ZipReader(const core::Path& path)
    : filepath_(path) {
}

ZipReader::~ZipReader() {
    cleanup();
}

bool ZipReader::open() {
    cleanup();

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return false;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for reading: {}, error: {}", filepath_.string(), result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return false;
    }

    is_open_ = true;
    ARCHIVE_DEBUG("Zip archive opened for reading: {}", filepath_.string());
    buildEntryCache();
    return true;
}

void ZipReader::close() {
    cleanup();
}

std::vector<std::string> ZipReader::listFiles() const {
    std::vector<std::string> files;
    files.reserve(entry_cache_.size());
    for (const auto& [path, info] : entry_cache_) {
        if (!info.is_directory) {
            files.push_back(path);
        }
    }
    return files;
}

bool ZipReader::hasFile(std::string_view internal_path) const {
    return entry_cache_.find(std::string(internal_path)) != entry_cache_.end();
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) {
    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    auto cached = entry_cache_.find(std::string(internal_path));
    if (cached == entry_cache_.end()) {
        ARCHIVE_DEBUG("File {} not found in zip archive", internal_path);
        return ZipError::FileNotFound;
    }
    if (cached->second.uncompressed_size > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
        ARCHIVE_ERROR("File {} is too large to extract ({} bytes)", internal_path, cached->second.uncompressed_size);
        return ZipError::TooLarge;
    }

    std::string path_str(internal_path);
    if (mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 0) != MZ_OK) {
        return ZipError::FileNotFound;
    }
    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", internal_path);
        return ZipError::IoFail;
    }

    const auto expected = static_cast<int32_t>(cached->second.uncompressed_size);
    std::string buffer(static_cast<size_t>(expected), '\0');
    int32_t total = 0;
    while (total < expected) {
        const int32_t chunk = std::min(expected - total, static_cast<int32_t>(core::Constants::kIOBufferSize));
        int32_t read = mz_zip_reader_entry_read(unzip_handle_, &buffer[static_cast<size_t>(total)], chunk);
        if (read <= 0) {
            break;
        }
        total += read;
    }
    mz_zip_reader_entry_close(unzip_handle_);

    if (total != expected) {
        ARCHIVE_ERROR("Incomplete read for file {}, expected: {} bytes, read: {} bytes",
                      internal_path, expected, total);
        return ZipError::IoFail;
    }

    content.swap(buffer);
    ARCHIVE_DEBUG("Extracted file {} from zip, size: {} bytes", internal_path, content.size());
    return ZipError::Ok;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entry_cache_.clear();
}

void ZipReader::buildEntryCache() {
    entry_cache_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) == MZ_OK && file_info &&
            file_info->filename && file_info->filename[0] != '\0') {
            EntryInfo info;
            info.path = file_info->filename;
            info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
            info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
            info.is_directory = (info.path.back() == '/');
            entry_cache_[info.path] = info;
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);

    ARCHIVE_DEBUG("Built entry cache with {} entries", entry_cache_.size());
}

}} // namespace excelpipe::archive
