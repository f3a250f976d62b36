#include <jsonl/utils/common/logging.h>
#include <jsonl/utils/reader/error.h>
#include <jsonl/utils/reader/line_reader.h>
#include <jsonl/utils/utils/string.h>

#include "line_processors/vector_line_processor.h"

namespace jsonl::utils {

LineReader::LineReader(std::unique_ptr<Source> source, std::size_t capacity)
    : source_(std::move(source)),
      buffer_pos_(0),
      buffer_len_(0),
      accumulator_emitted_(false),
      skip_lf_(false),
      eof_(false),
      exhausted_(false) {
    if (!source_) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "LineReader requires a source");
    }
    if (capacity == 0) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Buffer capacity must be greater than 0");
    }
    buffer_.resize(capacity);
}

std::optional<std::string> LineReader::next_line() {
    std::string_view raw;
    while (next_raw_line(raw)) {
        std::string_view trimmed = string::trim(raw);
        if (!trimmed.empty()) {
            return string::to_utf8_lossy(trimmed);
        }
    }
    return std::nullopt;
}

std::size_t LineReader::count() {
    std::size_t lines = 0;
    std::string_view raw;
    while (next_raw_line(raw)) {
        if (!string::is_blank(raw)) {
            ++lines;
        }
    }
    JSONL_UTILS_LOG_DEBUG("LineReader::count - {} non-blank lines in {}",
                          lines, source_->describe());
    return lines;
}

void LineReader::read_lines_with_processor(LineProcessor &processor) {
    processor.begin();
    while (auto line = next_line()) {
        if (!processor.process(line->data(), line->size())) {
            break;
        }
    }
    processor.end();
}

std::vector<std::string> LineReader::collect() {
    std::vector<std::string> lines;
    VectorLineProcessor processor(lines);
    read_lines_with_processor(processor);
    return lines;
}

bool LineReader::fill_buffer() {
    if (eof_) {
        return false;
    }
    buffer_pos_ = 0;
    buffer_len_ = source_->read(buffer_.data(), buffer_.size());
    if (buffer_len_ == 0) {
        eof_ = true;
        return false;
    }
    JSONL_UTILS_LOG_TRACE("LineReader::fill_buffer - read {} bytes",
                          buffer_len_);
    return true;
}

bool LineReader::next_raw_line(std::string_view &line) {
    if (exhausted_) {
        return false;
    }
    if (accumulator_emitted_) {
        line_accumulator_.clear();
        accumulator_emitted_ = false;
    }

    while (true) {
        if (buffer_pos_ == buffer_len_ && !fill_buffer()) {
            break;
        }

        if (skip_lf_) {
            skip_lf_ = false;
            if (buffer_[buffer_pos_] == '\n') {
                ++buffer_pos_;
                continue;
            }
        }

        const char *data = buffer_.data();
        std::size_t end = buffer_pos_;
        while (end < buffer_len_ && !string::is_line_terminator(data[end])) {
            ++end;
        }

        if (end == buffer_len_) {
            line_accumulator_.append(data + buffer_pos_, end - buffer_pos_);
            buffer_pos_ = end;
            continue;
        }

        if (line_accumulator_.empty()) {
            line = std::string_view(data + buffer_pos_, end - buffer_pos_);
        } else {
            line_accumulator_.append(data + buffer_pos_, end - buffer_pos_);
            line = line_accumulator_;
            accumulator_emitted_ = true;
        }

        buffer_pos_ = end + 1;
        if (data[end] == '\r') {
            if (buffer_pos_ < buffer_len_) {
                if (data[buffer_pos_] == '\n') ++buffer_pos_;
            } else {
                skip_lf_ = true;
            }
        }
        return true;
    }

    exhausted_ = true;
    if (!line_accumulator_.empty()) {
        // Last line without a trailing terminator
        line = line_accumulator_;
        accumulator_emitted_ = true;
        return true;
    }
    return false;
}

}  // namespace jsonl::utils
