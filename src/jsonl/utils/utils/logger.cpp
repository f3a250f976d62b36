#include <jsonl/utils/utils/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace jsonl::utils::logger {

static bool string_to_log_level_internal(const std::string &level_str,
                                         spdlog::level::level_enum &level) {
    std::string lower_level = level_str;
    std::transform(lower_level.begin(), lower_level.end(),
                   lower_level.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower_level == "trace") {
        level = spdlog::level::trace;
    } else if (lower_level == "debug") {
        level = spdlog::level::debug;
    } else if (lower_level == "info") {
        level = spdlog::level::info;
    } else if (lower_level == "warn" || lower_level == "warning") {
        level = spdlog::level::warn;
    } else if (lower_level == "err" || lower_level == "error") {
        level = spdlog::level::err;
    } else if (lower_level == "critical") {
        level = spdlog::level::critical;
    } else if (lower_level == "off") {
        level = spdlog::level::off;
    } else {
        return false;
    }
    return true;
}

int set_log_level(const std::string &level_str) {
    spdlog::level::level_enum level;
    if (!string_to_log_level_internal(level_str, level)) {
        return -1;
    }
    spdlog::set_level(level);
    return 0;
}

int set_log_level_int(int level) {
    if (level < 0 || level > 6) {
        return -1;
    }
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
    return 0;
}

std::string get_log_level_string() {
    switch (spdlog::get_level()) {
        case spdlog::level::trace:
            return "trace";
        case spdlog::level::debug:
            return "debug";
        case spdlog::level::info:
            return "info";
        case spdlog::level::warn:
            return "warn";
        case spdlog::level::err:
            return "error";
        case spdlog::level::critical:
            return "critical";
        case spdlog::level::off:
            return "off";
        default:
            return "info";
    }
}

int get_log_level_int() { return static_cast<int>(spdlog::get_level()); }

void use_stderr_logger() {
    auto logger = spdlog::get("stderr");
    if (!logger) {
        logger = spdlog::stderr_color_mt("stderr");
    }
    spdlog::set_default_logger(logger);
}

}  // namespace jsonl::utils::logger

// ==============================================================================
// C API Implementation (wraps C++ implementation)
// ==============================================================================

extern "C" {

int jsonl_utils_set_log_level(const char *level_str) {
    if (!level_str) {
        return -1;
    }
    return jsonl::utils::logger::set_log_level(level_str);
}

int jsonl_utils_set_log_level_int(int level) {
    return jsonl::utils::logger::set_log_level_int(level);
}

const char *jsonl_utils_get_log_level_string() {
    static std::string level_string;
    level_string = jsonl::utils::logger::get_log_level_string();
    return level_string.c_str();
}

int jsonl_utils_get_log_level_int() {
    return jsonl::utils::logger::get_log_level_int();
}

}  // extern "C"
