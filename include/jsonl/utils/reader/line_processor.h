#ifndef JSONL_UTILS_READER_LINE_PROCESSOR_H
#define JSONL_UTILS_READER_LINE_PROCESSOR_H

#include <cstddef>

namespace jsonl::utils {

/**
 * Callback interface for line readers. Lines are trimmed, non-blank and
 * valid UTF-8; `data` is only valid for the duration of the call.
 */
class LineProcessor {
   public:
    virtual ~LineProcessor() = default;

    /**
     * @return false to stop reading after this line
     */
    virtual bool process(const char *data, std::size_t length) = 0;

    virtual void begin() {}
    virtual void end() {}
};

}  // namespace jsonl::utils

#endif  // JSONL_UTILS_READER_LINE_PROCESSOR_H
