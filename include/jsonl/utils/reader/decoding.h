#ifndef JSONL_UTILS_READER_DECODING_H
#define JSONL_UTILS_READER_DECODING_H

#include <jsonl/utils/reader/error.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace jsonl::utils {

/**
 * Turns one line into a record. Failure is reported by throwing any
 * std::exception.
 */
template <typename T>
using Decoder = std::function<T(const std::string &)>;

/**
 * Outcome of decoding a single line: a value or the DecodeError for that
 * line.
 */
template <typename T>
class DecodeResult {
   public:
    DecodeResult(T value) : data_(std::move(value)) {}
    DecodeResult(DecodeError error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    /**
     * @throws DecodeError if the line failed to decode
     */
    const T &value() const {
        if (!ok()) throw std::get<DecodeError>(data_);
        return std::get<T>(data_);
    }

    T &value() {
        if (!ok()) throw std::get<DecodeError>(data_);
        return std::get<T>(data_);
    }

    const DecodeError &error() const {
        if (ok()) {
            throw std::logic_error("DecodeResult holds a value, not an error");
        }
        return std::get<DecodeError>(data_);
    }

   private:
    std::variant<T, DecodeError> data_;
};

/**
 * Applies a Decoder to every line of a line reader or bounded window.
 * A decode failure yields an error result for that line only; I/O errors
 * from the underlying reader propagate as ReaderError.
 */
template <typename T, typename LineSource>
class DecodingLines {
   public:
    DecodingLines(LineSource lines, Decoder<T> decoder)
        : lines_(std::move(lines)),
          decoder_(std::move(decoder)),
          lines_read_(0) {}

    std::optional<DecodeResult<T>> next() {
        std::optional<std::string> line = lines_.next_line();
        if (!line) {
            return std::nullopt;
        }
        ++lines_read_;
        try {
            return DecodeResult<T>(decoder_(*line));
        } catch (const std::exception &e) {
            return DecodeResult<T>(
                DecodeError(std::move(*line), lines_read_, e.what()));
        }
    }

    std::vector<DecodeResult<T>> collect() {
        std::vector<DecodeResult<T>> results;
        while (auto result = next()) {
            results.push_back(std::move(*result));
        }
        return results;
    }

    /**
     * Number of lines handed to the decoder so far
     */
    std::size_t lines_read() const { return lines_read_; }

   private:
    LineSource lines_;
    Decoder<T> decoder_;
    std::size_t lines_read_;
};

}  // namespace jsonl::utils

#endif  // JSONL_UTILS_READER_DECODING_H
