#include <jsonl/utils/common/logging.h>
#include <jsonl/utils/reader/chunked_backward_reader.h>
#include <jsonl/utils/reader/error.h>

#include <algorithm>

namespace jsonl::utils {

ChunkedBackwardReader::ChunkedBackwardReader(std::unique_ptr<Source> source,
                                             std::size_t capacity)
    : source_(std::move(source)),
      position_(0),
      size_(0),
      initialized_(false) {
    if (!source_) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "ChunkedBackwardReader requires a source");
    }
    if (capacity == 0) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Buffer capacity must be greater than 0");
    }
    buffer_.resize(capacity);
}

void ChunkedBackwardReader::initialize() {
    if (initialized_) {
        return;
    }
    size_ = source_->seek_end();
    position_ = size_;
    initialized_ = true;
    JSONL_UTILS_LOG_DEBUG(
        "ChunkedBackwardReader::initialize - source={}, size={}, "
        "capacity={}",
        source_->describe(), size_, buffer_.size());
}

std::string_view ChunkedBackwardReader::next_chunk_backward(
    std::size_t max_len) {
    if (max_len == 0) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Chunk length must be greater than 0");
    }
    initialize();

    if (position_ == 0) {
        return std::string_view();
    }

    std::size_t read_len = static_cast<std::size_t>(
        std::min<std::uint64_t>(std::min(max_len, buffer_.size()), position_));

    std::uint64_t chunk_start = position_ - read_len;
    source_->seek(chunk_start);

    std::size_t total_read = 0;
    while (total_read < read_len) {
        std::size_t n =
            source_->read(buffer_.data() + total_read, read_len - total_read);
        if (n == 0) {
            throw ReaderError(
                ReaderError::UNEXPECTED_EOF,
                "Expected " + std::to_string(read_len) + " bytes at offset " +
                    std::to_string(chunk_start) + " of " +
                    source_->describe() + " but got " +
                    std::to_string(total_read));
        }
        total_read += n;
    }

    position_ = chunk_start;

    JSONL_UTILS_LOG_TRACE(
        "ChunkedBackwardReader::next_chunk_backward - read {} bytes, "
        "position now {} / {}",
        read_len, position_, size_);

    return std::string_view(buffer_.data(), read_len);
}

}  // namespace jsonl::utils
