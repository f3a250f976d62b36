#include <jsonl/utils/common/logging.h>
#include <jsonl/utils/reader/error.h>
#include <jsonl/utils/reader/jsonl.h>

namespace jsonl::utils {

static void validate_buffer_size(std::size_t size) {
    if (size == 0) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Buffer size must be greater than 0");
    }
}

Jsonl::Jsonl(std::unique_ptr<Source> source, std::size_t buffer_size)
    : source_(std::move(source)), buffer_size_(buffer_size) {
    if (!source_) {
        throw ReaderError(ReaderError::INITIALIZATION_ERROR,
                          "Jsonl requires a source");
    }
    validate_buffer_size(buffer_size_);
}

Jsonl Jsonl::from_path(const std::string &path, std::size_t buffer_size) {
    return Jsonl(std::make_unique<FileSource>(path), buffer_size);
}

Jsonl Jsonl::from_string(std::string data, std::size_t buffer_size) {
    return Jsonl(std::make_unique<MemorySource>(std::move(data)), buffer_size);
}

void Jsonl::set_buffer_size(std::size_t size) {
    validate_buffer_size(size);
    buffer_size_ = size;
}

std::unique_ptr<Source> Jsonl::take_source() {
    if (!source_) {
        throw ReaderError(ReaderError::INITIALIZATION_ERROR,
                          "Source already consumed by a previous reader");
    }
    JSONL_UTILS_LOG_DEBUG("Jsonl - handing {} to a reader (buffer size {})",
                          source_->describe(), buffer_size_);
    return std::move(source_);
}

LineReader Jsonl::lines() { return LineReader(take_source(), buffer_size_); }

ReverseLineReader Jsonl::reverse_lines() {
    return ReverseLineReader(take_source(), buffer_size_);
}

FirstNLines Jsonl::first_n(std::size_t n) { return FirstNLines(lines(), n); }

LastNLines Jsonl::last_n(std::size_t n) {
    return LastNLines(reverse_lines(), n);
}

std::size_t Jsonl::count() { return lines().count(); }

DecodingLines<json::JsonValue, LineReader> Jsonl::deserialize_values() {
    return deserialize<json::JsonValue>(json::decode_value);
}

}  // namespace jsonl::utils
