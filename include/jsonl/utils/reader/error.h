#ifndef JSONL_UTILS_READER_ERROR_H
#define JSONL_UTILS_READER_ERROR_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace jsonl::utils {

/**
 * Error raised by sources and line readers. Fatal to the current call.
 */
class ReaderError : public std::runtime_error {
   public:
    enum Type {
        FILE_IO_ERROR,
        UNEXPECTED_EOF,
        INVALID_ARGUMENT,
        INITIALIZATION_ERROR
    };

    ReaderError(Type type, const std::string &message)
        : std::runtime_error(format_message(type, message)), type_(type) {}

    Type get_type() const { return type_; }

   private:
    static std::string format_message(Type type, const std::string &message);
    Type type_;
};

/**
 * Per-line decode failure. Carries the raw line and its 1-based position
 * in the emitted line sequence.
 */
class DecodeError : public std::runtime_error {
   public:
    DecodeError(const std::string &line, std::size_t line_number,
                const std::string &reason);

    const std::string &get_line() const { return line_; }
    std::size_t get_line_number() const { return line_number_; }
    const std::string &get_reason() const { return reason_; }

   private:
    std::string line_;
    std::size_t line_number_;
    std::string reason_;
};

}  // namespace jsonl::utils

#endif  // JSONL_UTILS_READER_ERROR_H
