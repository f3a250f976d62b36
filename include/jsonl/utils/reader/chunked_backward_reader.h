#ifndef JSONL_UTILS_READER_CHUNKED_BACKWARD_READER_H
#define JSONL_UTILS_READER_CHUNKED_BACKWARD_READER_H

#include <jsonl/utils/common/constants.h>
#include <jsonl/utils/reader/source.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace jsonl::utils {

/**
 * Reads a seekable source in fixed-size chunks, from its end toward its
 * beginning.
 *
 * The source size is queried once, on initialize(), and assumed constant
 * afterwards. Each chunk is returned in forward file order and stays
 * valid until the next call to next_chunk_backward().
 */
class ChunkedBackwardReader {
   public:
    explicit ChunkedBackwardReader(
        std::unique_ptr<Source> source,
        std::size_t capacity = constants::reader::DEFAULT_BUFFER_SIZE);

    ChunkedBackwardReader(const ChunkedBackwardReader &) = delete;
    ChunkedBackwardReader &operator=(const ChunkedBackwardReader &) = delete;
    ChunkedBackwardReader(ChunkedBackwardReader &&) noexcept = default;
    ChunkedBackwardReader &operator=(ChunkedBackwardReader &&) noexcept =
        default;

    /**
     * Learn the source size and position the cursor at its end.
     * Subsequent calls are no-ops.
     * @throws ReaderError FILE_IO_ERROR if the size cannot be determined
     */
    void initialize();

    /**
     * Read the chunk [position - n, position) with
     * n = min(max_len, capacity, position) and move the cursor to its start.
     * Initializes the reader on first use.
     * @return the chunk, empty once the cursor reached offset 0
     * @throws ReaderError INVALID_ARGUMENT when max_len is 0,
     *         FILE_IO_ERROR on seek/read failure,
     *         UNEXPECTED_EOF when the source ends before the chunk is filled
     */
    std::string_view next_chunk_backward(std::size_t max_len);

    std::string_view next_chunk_backward() {
        return next_chunk_backward(buffer_.size());
    }

    std::uint64_t position() const { return position_; }
    std::uint64_t size() const { return size_; }
    std::size_t capacity() const { return buffer_.size(); }
    bool is_initialized() const { return initialized_; }
    bool is_exhausted() const { return initialized_ && position_ == 0; }
    const Source &get_source() const { return *source_; }

   private:
    std::unique_ptr<Source> source_;
    std::vector<char> buffer_;
    std::uint64_t position_;
    std::uint64_t size_;
    bool initialized_;
};

}  // namespace jsonl::utils

#endif  // JSONL_UTILS_READER_CHUNKED_BACKWARD_READER_H
