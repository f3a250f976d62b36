#include <jsonl/utils/reader/error.h>

namespace jsonl::utils {

namespace {
// Keep diagnostics readable when a decoder rejects a very long line
constexpr std::size_t MAX_LINE_IN_MESSAGE = 120;

std::string preview(const std::string &line) {
    if (line.size() <= MAX_LINE_IN_MESSAGE) return line;
    return line.substr(0, MAX_LINE_IN_MESSAGE) + "...";
}
}  // namespace

std::string ReaderError::format_message(Type type,
                                        const std::string &message) {
    const char *prefix = "";
    switch (type) {
        case FILE_IO_ERROR:
            prefix = "File I/O error";
            break;
        case UNEXPECTED_EOF:
            prefix = "Unexpected end of file";
            break;
        case INVALID_ARGUMENT:
            prefix = "Invalid argument";
            break;
        case INITIALIZATION_ERROR:
            prefix = "Initialization error";
            break;
    }
    return std::string(prefix) + ": " + message;
}

DecodeError::DecodeError(const std::string &line, std::size_t line_number,
                         const std::string &reason)
    : std::runtime_error("Failed to decode line " +
                         std::to_string(line_number) + " (" + reason +
                         "): " + preview(line)),
      line_(line),
      line_number_(line_number),
      reason_(reason) {}

}  // namespace jsonl::utils
