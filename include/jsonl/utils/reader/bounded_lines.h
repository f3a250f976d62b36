#ifndef JSONL_UTILS_READER_BOUNDED_LINES_H
#define JSONL_UTILS_READER_BOUNDED_LINES_H

#include <jsonl/utils/reader/line_processor.h>
#include <jsonl/utils/reader/line_reader.h>
#include <jsonl/utils/reader/reverse_line_reader.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jsonl::utils {

/**
 * At most N lines taken from a line reader (LineReader or
 * ReverseLineReader). Lines are pulled from the reader one at a time, on
 * demand; with N == 0 the reader is never touched.
 */
template <typename LineSource>
class BoundedLines {
   public:
    BoundedLines(LineSource lines, std::size_t n)
        : lines_(std::move(lines)), remaining_(n), exhausted_(n == 0) {}

    std::optional<std::string> next_line() {
        if (exhausted_) {
            return std::nullopt;
        }
        std::optional<std::string> line = lines_.next_line();
        if (!line) {
            exhausted_ = true;
            return std::nullopt;
        }
        if (--remaining_ == 0) {
            exhausted_ = true;
        }
        return line;
    }

    void read_lines_with_processor(LineProcessor &processor) {
        processor.begin();
        while (auto line = next_line()) {
            if (!processor.process(line->data(), line->size())) {
                break;
            }
        }
        processor.end();
    }

    /**
     * Drain the window in emission order
     */
    std::vector<std::string> collect() {
        std::vector<std::string> lines;
        while (auto line = next_line()) {
            lines.push_back(std::move(*line));
        }
        return lines;
    }

    std::size_t remaining() const { return remaining_; }
    bool is_exhausted() const { return exhausted_; }

   protected:
    LineSource lines_;
    std::size_t remaining_;
    bool exhausted_;
};

/**
 * First N non-blank lines, in source order.
 */
using FirstNLines = BoundedLines<LineReader>;

/**
 * Last N non-blank lines. Iteration yields the last line first; use
 * collect_chronological() for source order.
 */
class LastNLines : public BoundedLines<ReverseLineReader> {
   public:
    using BoundedLines<ReverseLineReader>::BoundedLines;

    std::vector<std::string> collect_chronological() {
        std::vector<std::string> lines = collect();
        std::reverse(lines.begin(), lines.end());
        return lines;
    }
};

}  // namespace jsonl::utils

#endif  // JSONL_UTILS_READER_BOUNDED_LINES_H
