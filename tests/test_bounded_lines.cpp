#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <jsonl/utils/reader/bounded_lines.h>
#include <jsonl/utils/reader/error.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "testing_utilities.h"

using namespace jsonl::utils;
using namespace jsonl_utils_test;

namespace {
// Serves the first read, fails on every later one
class SingleReadSource : public Source {
   public:
    explicit SingleReadSource(std::string data) : data_(std::move(data)) {}

    std::uint64_t seek_end() override { return data_.size(); }
    void seek(std::uint64_t) override {}
    std::size_t read(char *buffer, std::size_t length) override {
        if (served_) {
            throw ReaderError(ReaderError::FILE_IO_ERROR, "second read");
        }
        served_ = true;
        std::size_t n = std::min(length, data_.size());
        std::memcpy(buffer, data_.data(), n);
        return n;
    }
    std::string describe() const override { return "<single-read>"; }

   private:
    std::string data_;
    bool served_ = false;
};

// Fails on any seek below min_offset
class TailOnlySource : public Source {
   public:
    TailOnlySource(std::string data, std::uint64_t min_offset)
        : memory_(data), min_offset_(min_offset) {}

    std::uint64_t seek_end() override { return memory_.seek_end(); }
    void seek(std::uint64_t offset) override {
        if (offset < min_offset_) {
            throw ReaderError(ReaderError::FILE_IO_ERROR,
                              "seek below " + std::to_string(min_offset_));
        }
        memory_.seek(offset);
    }
    std::size_t read(char *buffer, std::size_t length) override {
        return memory_.read(buffer, length);
    }
    std::string describe() const override { return "<tail-only>"; }

   private:
    MemorySource memory_;
    std::uint64_t min_offset_;
};

FirstNLines first_n(const std::string &data, std::size_t n,
                    std::size_t capacity = 8192) {
    return FirstNLines(
        LineReader(std::make_unique<MemorySource>(data), capacity), n);
}

LastNLines last_n(const std::string &data, std::size_t n,
                  std::size_t capacity = 8192) {
    return LastNLines(
        ReverseLineReader(std::make_unique<MemorySource>(data), capacity), n);
}
}  // namespace

TEST_CASE("FirstNLines - window over the front") {
    std::string data = "a\nb\nc\n";

    CHECK(first_n(data, 2).collect() == std::vector<std::string>{"a", "b"});
    CHECK(first_n(data, 3).collect() ==
          std::vector<std::string>{"a", "b", "c"});

    SUBCASE("N beyond the line count yields every line") {
        CHECK(first_n(data, 10).collect() ==
              std::vector<std::string>{"a", "b", "c"});
    }

    SUBCASE("Blank lines do not count toward N") {
        CHECK(first_n("\n\na\n\n\nb\nc", 2).collect() ==
              std::vector<std::string>{"a", "b"});
    }
}

TEST_CASE("FirstNLines - remaining and exhaustion") {
    FirstNLines window = first_n("a\nb\nc\n", 2);
    CHECK(window.remaining() == 2);
    CHECK_FALSE(window.is_exhausted());

    CHECK(window.next_line() == std::optional<std::string>("a"));
    CHECK(window.remaining() == 1);
    CHECK(window.next_line() == std::optional<std::string>("b"));
    CHECK(window.remaining() == 0);
    CHECK(window.is_exhausted());
    CHECK(window.next_line() == std::nullopt);
}

TEST_CASE("FirstNLines - N of zero never reads") {
    FirstNLines window(LineReader(std::make_unique<FailingSource>(), 8), 0);
    CHECK(window.is_exhausted());
    CHECK(window.next_line() == std::nullopt);
    CHECK(window.collect().empty());
}

TEST_CASE("FirstNLines - stops reading once N lines were produced") {
    // Everything needed fits in the first read; a second read would throw
    FirstNLines window(
        LineReader(std::make_unique<SingleReadSource>("a\nb\nc\nd\n"), 64), 2);
    std::vector<std::string> lines;
    CHECK_NOTHROW(lines = window.collect());
    CHECK(lines == std::vector<std::string>{"a", "b"});
}

TEST_CASE("LastNLines - window over the back") {
    std::string data = "a\nb\nc\n";

    LastNLines window = last_n(data, 2);
    CHECK(window.next_line() == std::optional<std::string>("c"));
    CHECK(window.next_line() == std::optional<std::string>("b"));
    CHECK(window.next_line() == std::nullopt);

    SUBCASE("N beyond the line count") {
        CHECK(last_n(data, 5).collect() ==
              std::vector<std::string>{"c", "b", "a"});
    }

    SUBCASE("Chronological order") {
        CHECK(last_n(data, 2).collect_chronological() ==
              std::vector<std::string>{"b", "c"});
        CHECK(last_n(data, 5).collect_chronological() ==
              std::vector<std::string>{"a", "b", "c"});
    }

    SUBCASE("Empty source") { CHECK(last_n("", 3).collect().empty()); }
}

TEST_CASE("LastNLines - N of zero never reads") {
    LastNLines window(ReverseLineReader(std::make_unique<FailingSource>(), 8),
                      0);
    CHECK(window.is_exhausted());
    CHECK(window.collect_chronological().empty());
}

TEST_CASE("LastNLines - only reads the tail it needs") {
    // Chunks of 3 from the end start at offsets 5 and 2; 'd' and 'c' are
    // resolved without reaching the front of the source
    std::string data = "a\nb\nc\nd\n";

    LastNLines window(
        ReverseLineReader(std::make_unique<TailOnlySource>(data, 2), 3), 2);
    std::vector<std::string> lines;
    CHECK_NOTHROW(lines = window.collect());
    CHECK(lines == std::vector<std::string>{"d", "c"});

    LastNLines deeper(
        ReverseLineReader(std::make_unique<TailOnlySource>(data, 2), 3), 3);
    CHECK(reader_error_type([&] { deeper.collect(); }) ==
          ReaderError::FILE_IO_ERROR);
}

TEST_CASE("Bounded windows - Unicode blank lines do not count toward N") {
    std::string data = "a\n\xC2\xA0\nb\n\xE3\x80\x80\nc\n";
    CHECK(first_n(data, 2).collect() == std::vector<std::string>{"a", "b"});
    CHECK(last_n(data, 2).collect() == std::vector<std::string>{"c", "b"});
}

TEST_CASE("Bounded windows - independent of capacity") {
    std::vector<std::string> events = generate_events(60);
    std::string data = join_lines(events, "\r\n");

    std::vector<std::string> head(events.begin(), events.begin() + 15);
    std::vector<std::string> tail(events.end() - 15, events.end());

    for (std::size_t capacity : {1, 2, 3, 7, 64, 8192}) {
        CAPTURE(capacity);
        CHECK(first_n(data, 15, capacity).collect() == head);
        CHECK(last_n(data, 15, capacity).collect_chronological() == tail);
    }
}

TEST_CASE("Bounded windows - processor") {
    class Collect : public LineProcessor {
       public:
        bool process(const char *data, std::size_t length) override {
            lines.emplace_back(data, length);
            return true;
        }
        std::vector<std::string> lines;
    };

    Collect processor;
    last_n("1\n2\n3\n4\n", 3).read_lines_with_processor(processor);
    CHECK(processor.lines == std::vector<std::string>{"4", "3", "2"});
}
