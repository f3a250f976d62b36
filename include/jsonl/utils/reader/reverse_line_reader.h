#ifndef JSONL_UTILS_READER_REVERSE_LINE_READER_H
#define JSONL_UTILS_READER_REVERSE_LINE_READER_H

#include <jsonl/utils/common/constants.h>
#include <jsonl/utils/reader/chunked_backward_reader.h>
#include <jsonl/utils/reader/line_processor.h>
#include <jsonl/utils/reader/source.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace jsonl::utils {

/**
 * Yields the logical lines of a seekable source from last to first.
 *
 * Chunks are pulled from a ChunkedBackwardReader only when the bytes
 * already held contain no resolvable line boundary. Bytes that do not yet
 * form a complete line are kept in a carry buffer that grows toward the
 * front, so lines longer than the chunk capacity are supported.
 *
 * Both '\n' and a bare '\r' end a line; the '\r' of a "\r\n" pair is
 * stripped rather than treated as a second terminator. Lines are trimmed
 * of Unicode whitespace, blank lines are skipped, and invalid UTF-8 is
 * replaced with U+FFFD.
 *
 * Usage:
 * @code
 * ReverseLineReader reader(std::make_unique<FileSource>("events.jsonl"));
 * while (auto line = reader.next_line()) {
 *     // last line first
 * }
 * @endcode
 */
class ReverseLineReader {
   public:
    explicit ReverseLineReader(
        std::unique_ptr<Source> source,
        std::size_t capacity = constants::reader::DEFAULT_BUFFER_SIZE);
    explicit ReverseLineReader(ChunkedBackwardReader reader);

    ReverseLineReader(const ReverseLineReader &) = delete;
    ReverseLineReader &operator=(const ReverseLineReader &) = delete;
    ReverseLineReader(ReverseLineReader &&) noexcept = default;
    ReverseLineReader &operator=(ReverseLineReader &&) noexcept = default;

    /**
     * @return the previous non-blank line, std::nullopt once the start of
     *         the source has been reached
     * @throws ReaderError on seek/read failure of the source
     */
    std::optional<std::string> next_line();

    /**
     * Feed the remaining lines, last first, to a processor until it
     * returns false or the source is exhausted
     */
    void read_lines_with_processor(LineProcessor &processor);

    /**
     * Drain the remaining lines, last first
     */
    std::vector<std::string> collect();

    bool is_exhausted() const { return state_ == State::EXHAUSTED; }
    std::size_t capacity() const { return reader_.capacity(); }
    const ChunkedBackwardReader &get_chunk_reader() const { return reader_; }

   private:
    enum class State { UNINITIALIZED, SCANNING, EXHAUSTED };

    bool fetch_chunk();
    void prepend(const char *data, std::size_t length);
    void strip_pending_carriage_return();
    void release_carry();

    ChunkedBackwardReader reader_;
    State state_;

    // carry_[carry_begin_, carry_end_) holds bytes not yet resolved into a
    // line; carry_end_ is the current line boundary. The range
    // [scan_end_, carry_end_) is known to contain no terminator.
    std::vector<char> carry_;
    std::size_t carry_begin_;
    std::size_t carry_end_;
    std::size_t scan_end_;
    // The boundary at carry_end_ was a '\n'; a '\r' right before it is
    // part of the same terminator.
    bool strip_cr_;
};

}  // namespace jsonl::utils

#endif  // JSONL_UTILS_READER_REVERSE_LINE_READER_H
