#ifndef JSONL_UTILS_READER_LINE_READER_H
#define JSONL_UTILS_READER_LINE_READER_H

#include <jsonl/utils/common/constants.h>
#include <jsonl/utils/reader/line_processor.h>
#include <jsonl/utils/reader/source.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonl::utils {

/**
 * Buffered forward line reader. Reads from the current position of the
 * source and never seeks, so it also works on non-seekable streams.
 *
 * Line splitting and filtering match ReverseLineReader: '\n', "\r\n" and
 * a bare '\r' end a line, lines are trimmed and blank lines are skipped.
 */
class LineReader {
   public:
    explicit LineReader(
        std::unique_ptr<Source> source,
        std::size_t capacity = constants::reader::DEFAULT_BUFFER_SIZE);

    LineReader(const LineReader &) = delete;
    LineReader &operator=(const LineReader &) = delete;
    LineReader(LineReader &&) noexcept = default;
    LineReader &operator=(LineReader &&) noexcept = default;

    /**
     * @return the next non-blank line, std::nullopt at end of source
     * @throws ReaderError on read failure
     */
    std::optional<std::string> next_line();

    /**
     * Drain the source and count its non-blank lines. Lines are neither
     * decoded nor kept.
     */
    std::size_t count();

    void read_lines_with_processor(LineProcessor &processor);
    std::vector<std::string> collect();

    bool is_exhausted() const { return exhausted_; }
    std::size_t capacity() const { return buffer_.size(); }

   private:
    bool next_raw_line(std::string_view &line);
    bool fill_buffer();

    std::unique_ptr<Source> source_;
    std::vector<char> buffer_;
    std::size_t buffer_pos_;
    std::size_t buffer_len_;
    // Holds a line that spans more than one buffer fill
    std::string line_accumulator_;
    bool accumulator_emitted_;
    // Last byte seen was a '\r' at the end of a buffer fill
    bool skip_lf_;
    bool eof_;
    bool exhausted_;
};

}  // namespace jsonl::utils

#endif  // JSONL_UTILS_READER_LINE_READER_H
