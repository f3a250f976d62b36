#ifndef JSONL_UTILS_COMMON_LOGGING_H
#define JSONL_UTILS_COMMON_LOGGING_H

#include <jsonl/utils/config.h>

// SPDLOG_ACTIVE_LEVEL decides which of the macros below survive
// preprocessing. It must be defined before spdlog is included.
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL JSONL_UTILS_LOGGER_ACTIVE_LEVEL
#endif

#include <spdlog/spdlog.h>

// Format strings use the fmt syntax: JSONL_UTILS_LOG_DEBUG("read {} bytes", n)
#define JSONL_UTILS_LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define JSONL_UTILS_LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define JSONL_UTILS_LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define JSONL_UTILS_LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define JSONL_UTILS_LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)

#endif  // JSONL_UTILS_COMMON_LOGGING_H
