#include <jsonl/utils/common/constants.h>
#include <jsonl/utils/config.h>
#include <jsonl/utils/reader/error.h>
#include <jsonl/utils/reader/jsonl.h>
#include <jsonl/utils/utils/json.h>
#include <jsonl/utils/utils/logger.h>
#include <spdlog/spdlog.h>

#include <argparse/argparse.hpp>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>

using namespace jsonl::utils;

static void write_line(const std::string &line) {
  fwrite(line.data(), 1, line.size(), stdout);
  fputc('\n', stdout);
}

int main(int argc, char **argv) {
  argparse::ArgumentParser program("jsonl_reader",
                                   JSONL_UTILS_PACKAGE_VERSION);
  program.add_description(
      "Print, count or validate lines of a JSON Lines file, from the front "
      "or from the back");
  program.add_argument("file").help("JSONL file to read").required();
  program.add_argument("-m", "--mode")
      .help("What to do with the file (head, tail, all, count)")
      .default_value<std::string>("all")
      .choices("head", "tail", "all", "count");
  program.add_argument("-n", "--lines")
      .help("Number of lines for head and tail")
      .default_value<std::size_t>(constants::tool::DEFAULT_WINDOW_SIZE)
      .scan<'d', std::size_t>();
  program.add_argument("-r", "--reverse")
      .help("In 'all' mode, print lines last first")
      .flag();
  program.add_argument("--chronological")
      .help("In 'tail' mode, print lines in file order")
      .flag();
  program.add_argument("--validate")
      .help("Parse every printed line as JSON and report failures")
      .flag();
  program.add_argument("--buffer-size")
      .help("Read buffer size in bytes (default: 8KB)")
      .default_value<std::size_t>(constants::reader::DEFAULT_BUFFER_SIZE)
      .scan<'d', std::size_t>();
  program.add_argument("--log-level")
      .help(
          "Set logging level (trace, debug, info, warn, error, critical, off)")
      .default_value<std::string>("info");

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception &err) {
    spdlog::error("Error occurred: {}", err.what());
    std::cerr << program;
    return 1;
  }

  std::string path = program.get<std::string>("file");
  std::string mode = program.get<std::string>("--mode");
  std::size_t n = program.get<std::size_t>("--lines");
  bool reverse = program.get<bool>("--reverse");
  bool chronological = program.get<bool>("--chronological");
  bool validate = program.get<bool>("--validate");
  std::size_t buffer_size = program.get<std::size_t>("--buffer-size");
  std::string log_level_str = program.get<std::string>("--log-level");

  // stderr-based logger to ensure logs don't interfere with data output
  logger::use_stderr_logger();
  if (logger::set_log_level(log_level_str) != 0) {
    spdlog::error("Unknown log level '{}'", log_level_str);
    return 1;
  }

  spdlog::debug("Processing file: {}", path);
  spdlog::debug("Mode: {}", mode);
  spdlog::debug("Lines: {}", n);
  spdlog::debug("Buffer size: {} bytes", buffer_size);

  if (buffer_size == 0) {
    spdlog::error("Buffer size must be positive");
    return 1;
  }

  std::size_t invalid_lines = 0;
  std::size_t printed_lines = 0;
  auto emit = [&](const std::string &line) {
    if (validate) {
      try {
        json::JsonValue::parse(line);
      } catch (const simdjson::simdjson_error &e) {
        ++invalid_lines;
        spdlog::warn("Invalid JSON ({}): {}", e.what(), line);
      }
    }
    write_line(line);
    ++printed_lines;
  };

  try {
    Jsonl jsonl = Jsonl::from_path(path, buffer_size);

    if (mode == "count") {
      std::size_t count = jsonl.count();
      std::printf("%zu\n", count);
    } else if (mode == "head") {
      auto head = jsonl.first_n(n);
      while (auto line = head.next_line()) {
        emit(*line);
      }
    } else if (mode == "tail") {
      auto tail = jsonl.last_n(n);
      if (chronological) {
        for (const auto &line : tail.collect_chronological()) {
          emit(line);
        }
      } else {
        while (auto line = tail.next_line()) {
          emit(*line);
        }
      }
    } else if (reverse) {
      auto lines = jsonl.reverse_lines();
      while (auto line = lines.next_line()) {
        emit(*line);
      }
    } else {
      auto lines = jsonl.lines();
      while (auto line = lines.next_line()) {
        emit(*line);
      }
    }
    fflush(stdout);
  } catch (const ReaderError &e) {
    spdlog::error("Reader error: {}", e.what());
    return 1;
  }

  spdlog::debug("Printed {} lines", printed_lines);
  if (validate && invalid_lines > 0) {
    spdlog::error("{} of {} lines are not valid JSON", invalid_lines,
                  printed_lines);
    return 2;
  }
  return 0;
}
