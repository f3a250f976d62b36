#ifndef JSONL_UTILS_UTILS_FILESYSTEM_H
#define JSONL_UTILS_UTILS_FILESYSTEM_H

#if defined(__APPLE__) && __has_include(<filesystem>)
// macOS with __fs filesystem namespace
#include <filesystem>
namespace fs = std::__fs::filesystem;
#else
#include <filesystem>
namespace fs = std::filesystem;
#endif

#endif  // JSONL_UTILS_UTILS_FILESYSTEM_H
