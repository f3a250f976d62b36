#ifndef JSONL_UTILS_UTILS_LOGGER_H
#define JSONL_UTILS_UTILS_LOGGER_H

#ifdef __cplusplus
extern "C" {
#endif
/**
 * Set the global log level
 * @param level_str case insensitive: "trace", "debug", "info",
 *                  "warn"/"warning", "err"/"error", "critical", "off"
 * @return 0 on success, -1 if level_str is NULL or not a known level
 */
int jsonl_utils_set_log_level(const char *level_str);

/**
 * Set the global log level from its integer value
 * @param level 0=trace, 1=debug, 2=info, 3=warn, 4=error, 5=critical, 6=off
 * @return 0 on success, -1 if level is out of range
 */
int jsonl_utils_set_log_level_int(int level);

/**
 * Get the current log level as a string (pointer to static storage)
 */
const char *jsonl_utils_get_log_level_string(void);

int jsonl_utils_get_log_level_int(void);

#ifdef __cplusplus
}

#include <string>

namespace jsonl::utils::logger {
int set_log_level(const std::string &level_str);
int set_log_level_int(int level);
std::string get_log_level_string();
int get_log_level_int();

/**
 * Route all library logging to stderr so that it never mixes with data
 * written to stdout
 */
void use_stderr_logger();
}  // namespace jsonl::utils::logger
#endif

#endif  // JSONL_UTILS_UTILS_LOGGER_H
