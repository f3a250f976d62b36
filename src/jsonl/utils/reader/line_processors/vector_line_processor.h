#ifndef JSONL_UTILS_READER_LINE_PROCESSORS_VECTOR_LINE_PROCESSOR_H
#define JSONL_UTILS_READER_LINE_PROCESSORS_VECTOR_LINE_PROCESSOR_H

#include <jsonl/utils/reader/line_processor.h>

#include <string>
#include <vector>

namespace jsonl::utils {

/**
 * LineProcessor that copies every line into a vector.
 * Used internally by the readers' collect().
 */
class VectorLineProcessor : public LineProcessor {
   private:
    std::vector<std::string> &result_;

   public:
    explicit VectorLineProcessor(std::vector<std::string> &result)
        : result_(result) {}

    bool process(const char *data, std::size_t length) override {
        result_.emplace_back(data, length);
        return true;
    }
};

}  // namespace jsonl::utils

#endif  // JSONL_UTILS_READER_LINE_PROCESSORS_VECTOR_LINE_PROCESSOR_H
