#include <jsonl/utils/common/logging.h>
#include <jsonl/utils/reader/reverse_line_reader.h>
#include <jsonl/utils/utils/string.h>

#include <algorithm>
#include <cstring>
#include <string_view>

#include "line_processors/vector_line_processor.h"

namespace jsonl::utils {

ReverseLineReader::ReverseLineReader(std::unique_ptr<Source> source,
                                     std::size_t capacity)
    : ReverseLineReader(ChunkedBackwardReader(std::move(source), capacity)) {}

ReverseLineReader::ReverseLineReader(ChunkedBackwardReader reader)
    : reader_(std::move(reader)),
      state_(State::UNINITIALIZED),
      carry_begin_(0),
      carry_end_(0),
      scan_end_(0),
      strip_cr_(false) {}

std::optional<std::string> ReverseLineReader::next_line() {
    if (state_ == State::EXHAUSTED) {
        return std::nullopt;
    }

    if (state_ == State::UNINITIALIZED) {
        reader_.initialize();
        if (reader_.size() == 0) {
            JSONL_UTILS_LOG_DEBUG(
                "ReverseLineReader::next_line - empty source {}",
                reader_.get_source().describe());
            state_ = State::EXHAUSTED;
            return std::nullopt;
        }
        state_ = State::SCANNING;
    }

    while (true) {
        strip_pending_carriage_return();

        std::size_t i = scan_end_;
        while (i > carry_begin_ && !string::is_line_terminator(carry_[i - 1])) {
            --i;
        }

        if (i > carry_begin_) {
            std::size_t terminator = i - 1;
            std::string_view candidate(carry_.data() + i, carry_end_ - i);
            std::string_view trimmed = string::trim(candidate);

            strip_cr_ = carry_[terminator] == '\n';
            carry_end_ = terminator;
            scan_end_ = terminator;

            if (!trimmed.empty()) {
                // trimmed still points into carry_, which is untouched
                // until the next call
                return string::to_utf8_lossy(trimmed);
            }
            // Blank line: keep scanning what is already buffered
            continue;
        }

        scan_end_ = carry_begin_;
        if (!fetch_chunk()) {
            break;
        }
    }

    // Start of the source: whatever is left is its first line
    std::string_view rest(carry_.data() + carry_begin_,
                          carry_end_ - carry_begin_);
    std::string_view trimmed = string::trim(rest);
    std::optional<std::string> line;
    if (!trimmed.empty()) {
        line = string::to_utf8_lossy(trimmed);
    }
    state_ = State::EXHAUSTED;
    release_carry();
    JSONL_UTILS_LOG_DEBUG(
        "ReverseLineReader::next_line - reached start of {}",
        reader_.get_source().describe());
    return line;
}

void ReverseLineReader::read_lines_with_processor(LineProcessor &processor) {
    processor.begin();
    while (auto line = next_line()) {
        if (!processor.process(line->data(), line->size())) {
            break;
        }
    }
    processor.end();
}

std::vector<std::string> ReverseLineReader::collect() {
    std::vector<std::string> lines;
    VectorLineProcessor processor(lines);
    read_lines_with_processor(processor);
    return lines;
}

bool ReverseLineReader::fetch_chunk() {
    if (reader_.is_exhausted()) {
        return false;
    }
    std::string_view chunk = reader_.next_chunk_backward();
    if (chunk.empty()) {
        return false;
    }
    prepend(chunk.data(), chunk.size());
    return true;
}

void ReverseLineReader::prepend(const char *data, std::size_t length) {
    std::size_t live = carry_end_ - carry_begin_;
    std::size_t scanned = carry_end_ - scan_end_;

    if (live == 0) {
        // Nothing pending: move the window back to the end of the buffer
        // to regain all of its headroom
        carry_begin_ = carry_end_ = scan_end_ = carry_.size();
    }

    if (carry_begin_ < length) {
        // Keep at least as much headroom as live data so that a long line
        // costs amortized O(1) per byte
        std::size_t required = 2 * live + length;
        if (carry_.size() >= required) {
            std::size_t new_end = carry_.size();
            std::memmove(carry_.data() + new_end - live,
                         carry_.data() + carry_begin_, live);
            carry_end_ = new_end;
        } else {
            std::size_t new_size =
                std::max({constants::reader::MIN_CARRY_CAPACITY,
                          2 * reader_.capacity(), 2 * (live + length)});
            std::vector<char> grown(new_size);
            if (live > 0) {
                std::memcpy(grown.data() + new_size - live,
                            carry_.data() + carry_begin_, live);
            }
            carry_.swap(grown);
            carry_end_ = new_size;
            JSONL_UTILS_LOG_TRACE(
                "ReverseLineReader::prepend - carry grown to {} bytes ({} "
                "live)",
                new_size, live);
        }
        carry_begin_ = carry_end_ - live;
        scan_end_ = carry_end_ - scanned;
    }

    carry_begin_ -= length;
    std::memcpy(carry_.data() + carry_begin_, data, length);
}

void ReverseLineReader::strip_pending_carriage_return() {
    if (!strip_cr_ || carry_end_ == carry_begin_) {
        return;
    }
    if (carry_[carry_end_ - 1] == '\r') {
        --carry_end_;
        scan_end_ = std::min(scan_end_, carry_end_);
    }
    strip_cr_ = false;
}

void ReverseLineReader::release_carry() {
    std::vector<char>().swap(carry_);
    carry_begin_ = carry_end_ = scan_end_ = 0;
}

}  // namespace jsonl::utils
