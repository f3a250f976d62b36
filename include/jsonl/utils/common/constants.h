#ifndef JSONL_UTILS_COMMON_CONSTANTS_H
#define JSONL_UTILS_COMMON_CONSTANTS_H

#include <cstddef>

namespace jsonl::utils::constants {
namespace reader {
static constexpr std::size_t DEFAULT_BUFFER_SIZE = 8192;  // 8KB
// Initial headroom reserved in front of the reverse carry buffer
static constexpr std::size_t MIN_CARRY_CAPACITY = 2 * DEFAULT_BUFFER_SIZE;
}  // namespace reader

namespace tool {
static constexpr std::size_t DEFAULT_WINDOW_SIZE = 10;
}  // namespace tool
}  // namespace jsonl::utils::constants

#endif  // JSONL_UTILS_COMMON_CONSTANTS_H
