#include <jsonl/utils/common/logging.h>
#include <jsonl/utils/common/platform_compat.h>
#include <jsonl/utils/reader/error.h>
#include <jsonl/utils/reader/source.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

namespace jsonl::utils {

using compat::file_offset_t;

namespace {
std::string errno_message() { return std::string(std::strerror(errno)); }
}  // namespace

FileSource::FileSource(const std::string &path)
    : path_(path), file_handle_(nullptr) {
    file_handle_ = fopen(path.c_str(), "rb");
    if (!file_handle_) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to open file: " + path + " (" +
                              errno_message() + ")");
    }
    JSONL_UTILS_LOG_DEBUG("Opened file source {}", path_);
}

FileSource::~FileSource() {
    if (file_handle_) {
        if (fclose(file_handle_) != 0) {
            JSONL_UTILS_LOG_WARN("Failed to close {} ({})", path_,
                                 errno_message());
        }
        file_handle_ = nullptr;
    }
}

std::uint64_t FileSource::seek_end() {
    if (compat::seek64(file_handle_, 0, SEEK_END) != 0) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to seek to end of " + path_ + " (" +
                              errno_message() + ")");
    }
    file_offset_t size = compat::tell64(file_handle_);
    if (size < 0) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to query size of " + path_ + " (" +
                              errno_message() + ")");
    }
    return static_cast<std::uint64_t>(size);
}

void FileSource::seek(std::uint64_t offset) {
    if (offset >
        static_cast<std::uint64_t>(std::numeric_limits<file_offset_t>::max())) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Seek offset out of range for " + path_);
    }
    if (compat::seek64(file_handle_, static_cast<file_offset_t>(offset),
                       SEEK_SET) != 0) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to seek to offset " +
                              std::to_string(offset) + " in " + path_ +
                              " (" + errno_message() + ")");
    }
}

std::size_t FileSource::read(char *buffer, std::size_t length) {
    std::size_t bytes_read = fread(buffer, 1, length, file_handle_);
    if (bytes_read == 0 && ferror(file_handle_)) {
        clearerr(file_handle_);
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to read from " + path_);
    }
    return bytes_read;
}

MemorySource::MemorySource(std::string data)
    : data_(std::move(data)), position_(0) {}

std::uint64_t MemorySource::seek_end() {
    position_ = data_.size();
    return static_cast<std::uint64_t>(data_.size());
}

void MemorySource::seek(std::uint64_t offset) {
    if (offset > data_.size()) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Seek offset " + std::to_string(offset) +
                              " beyond end of memory source (" +
                              std::to_string(data_.size()) + " bytes)");
    }
    position_ = static_cast<std::size_t>(offset);
}

std::size_t MemorySource::read(char *buffer, std::size_t length) {
    std::size_t available = data_.size() - position_;
    std::size_t n = std::min(length, available);
    if (n > 0) {
        std::memcpy(buffer, data_.data() + position_, n);
        position_ += n;
    }
    return n;
}

std::string MemorySource::describe() const {
    return "<memory:" + std::to_string(data_.size()) + " bytes>";
}

StreamSource::StreamSource(std::unique_ptr<std::istream> stream)
    : owned_(std::move(stream)), stream_(owned_.get()) {
    if (!stream_) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Null stream given to StreamSource");
    }
}

StreamSource::StreamSource(std::istream &stream) : stream_(&stream) {}

std::uint64_t StreamSource::seek_end() {
    stream_->clear();
    stream_->seekg(0, std::ios::end);
    std::streampos end = stream_->tellg();
    if (stream_->fail() || end < 0) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Stream does not support seeking to the end");
    }
    return static_cast<std::uint64_t>(end);
}

void StreamSource::seek(std::uint64_t offset) {
    stream_->clear();
    stream_->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (stream_->fail()) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to seek stream to offset " +
                              std::to_string(offset));
    }
}

std::size_t StreamSource::read(char *buffer, std::size_t length) {
    if (stream_->eof()) return 0;
    stream_->read(buffer, static_cast<std::streamsize>(length));
    std::streamsize n = stream_->gcount();
    if (stream_->bad()) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to read from stream");
    }
    return static_cast<std::size_t>(n);
}

}  // namespace jsonl::utils
