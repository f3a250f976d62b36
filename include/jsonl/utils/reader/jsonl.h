#ifndef JSONL_UTILS_READER_JSONL_H
#define JSONL_UTILS_READER_JSONL_H

#include <jsonl/utils/common/constants.h>
#include <jsonl/utils/reader/bounded_lines.h>
#include <jsonl/utils/reader/decoding.h>
#include <jsonl/utils/reader/line_reader.h>
#include <jsonl/utils/reader/reverse_line_reader.h>
#include <jsonl/utils/reader/source.h>
#include <jsonl/utils/utils/json.h>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace jsonl::utils {

/**
 * Entry point for reading a JSONL source.
 *
 * A Jsonl owns one source and hands it to exactly one reader: every
 * reader-producing method consumes the source, after which is_valid()
 * returns false and further calls throw ReaderError INITIALIZATION_ERROR.
 * Open the file again for a second pass.
 *
 * @code
 * auto tail = Jsonl::from_path("events.jsonl").last_n(10);
 * while (auto line = tail.next_line()) { ... }
 *
 * auto records = Jsonl::from_path("events.jsonl").deserialize_values();
 * while (auto record = records.next()) {
 *     if (!record->ok()) { log(record->error().what()); continue; }
 *     use(record->value());
 * }
 * @endcode
 */
class Jsonl {
   public:
    explicit Jsonl(
        std::unique_ptr<Source> source,
        std::size_t buffer_size = constants::reader::DEFAULT_BUFFER_SIZE);

    /**
     * @throws ReaderError FILE_IO_ERROR if the file cannot be opened
     */
    static Jsonl from_path(
        const std::string &path,
        std::size_t buffer_size = constants::reader::DEFAULT_BUFFER_SIZE);

    static Jsonl from_string(
        std::string data,
        std::size_t buffer_size = constants::reader::DEFAULT_BUFFER_SIZE);

    Jsonl(const Jsonl &) = delete;
    Jsonl &operator=(const Jsonl &) = delete;
    Jsonl(Jsonl &&) noexcept = default;
    Jsonl &operator=(Jsonl &&) noexcept = default;

    /**
     * Non-blank lines in source order
     */
    LineReader lines();

    /**
     * Non-blank lines, last line first
     */
    ReverseLineReader reverse_lines();

    FirstNLines first_n(std::size_t n);

    /**
     * Last n non-blank lines; the last line of the source comes first
     */
    LastNLines last_n(std::size_t n);

    /**
     * Number of non-blank lines
     */
    std::size_t count();

    template <typename T>
    DecodingLines<T, LineReader> deserialize(Decoder<T> decoder) {
        return DecodingLines<T, LineReader>(lines(), std::move(decoder));
    }

    template <typename T>
    DecodingLines<T, FirstNLines> deserialize_first_n(std::size_t n,
                                                      Decoder<T> decoder) {
        return DecodingLines<T, FirstNLines>(first_n(n), std::move(decoder));
    }

    template <typename T>
    DecodingLines<T, LastNLines> deserialize_last_n(std::size_t n,
                                                    Decoder<T> decoder) {
        return DecodingLines<T, LastNLines>(last_n(n), std::move(decoder));
    }

    /**
     * Every line parsed as a generic JSON value
     */
    DecodingLines<json::JsonValue, LineReader> deserialize_values();

    bool is_valid() const { return source_ != nullptr; }
    std::size_t get_buffer_size() const { return buffer_size_; }
    void set_buffer_size(std::size_t size);

   private:
    std::unique_ptr<Source> take_source();

    std::unique_ptr<Source> source_;
    std::size_t buffer_size_;
};

}  // namespace jsonl::utils

#endif  // JSONL_UTILS_READER_JSONL_H
