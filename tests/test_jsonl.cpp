#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <jsonl/utils/reader/error.h>
#include <jsonl/utils/reader/jsonl.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "testing_utilities.h"

using namespace jsonl::utils;
using namespace jsonl_utils_test;

TEST_CASE("Jsonl - forward and reverse over a file") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    std::string path = env.create_jsonl_file("events.jsonl", 300);
    REQUIRE(!path.empty());
    std::vector<std::string> events = generate_events(300);

    SUBCASE("Lines") {
        CHECK(Jsonl::from_path(path).lines().collect() == events);
    }

    SUBCASE("Reverse lines") {
        CHECK(Jsonl::from_path(path, 100).reverse_lines().collect() ==
              reversed(events));
    }

    SUBCASE("Reverse of forward") {
        std::vector<std::string> forward =
            Jsonl::from_path(path, 7).lines().collect();
        std::vector<std::string> backward =
            Jsonl::from_path(path, 64).reverse_lines().collect();
        CHECK(backward == reversed(forward));
    }

    SUBCASE("Count") { CHECK(Jsonl::from_path(path).count() == 300); }

    SUBCASE("Windows") {
        std::vector<std::string> head(events.begin(), events.begin() + 5);
        std::vector<std::string> tail(events.end() - 5, events.end());
        CHECK(Jsonl::from_path(path).first_n(5).collect() == head);
        CHECK(Jsonl::from_path(path).last_n(5).collect() == reversed(tail));
        CHECK(Jsonl::from_path(path).last_n(5).collect_chronological() ==
              tail);
        CHECK(Jsonl::from_path(path).first_n(1000).collect() == events);
        CHECK(Jsonl::from_path(path).last_n(1000).collect_chronological() ==
              events);
    }
}

TEST_CASE("Jsonl - in-memory scenarios") {
    CHECK(Jsonl::from_string("a\nb\nc\n").last_n(2).collect() ==
          std::vector<std::string>{"c", "b"});
    CHECK(Jsonl::from_string("a\nb\nc\n").first_n(2).collect() ==
          std::vector<std::string>{"a", "b"});
    CHECK(Jsonl::from_string("a\nb\r\nc").reverse_lines().collect() ==
          std::vector<std::string>{"c", "b", "a"});
    CHECK(Jsonl::from_string("x").lines().collect() ==
          std::vector<std::string>{"x"});
    CHECK(Jsonl::from_string("").lines().collect().empty());
    CHECK(Jsonl::from_string("").reverse_lines().collect().empty());
    CHECK(Jsonl::from_string("\n \n\t\n").count() == 0);
    CHECK(Jsonl::from_string("a\n", 1).first_n(0).collect().empty());
}

TEST_CASE("Jsonl - stream source") {
    Jsonl jsonl(std::make_unique<StreamSource>(
        std::make_unique<std::istringstream>("{\"a\":1}\n{\"a\":2}\n")));
    CHECK(jsonl.last_n(1).collect() == std::vector<std::string>{"{\"a\":2}"});
}

TEST_CASE("Jsonl - a source feeds one reader") {
    Jsonl jsonl = Jsonl::from_string("a\nb\n");
    CHECK(jsonl.is_valid());

    LineReader lines = jsonl.lines();
    CHECK_FALSE(jsonl.is_valid());

    CHECK(reader_error_type([&] { jsonl.lines(); }) ==
          ReaderError::INITIALIZATION_ERROR);
    CHECK(reader_error_type([&] { jsonl.reverse_lines(); }) ==
          ReaderError::INITIALIZATION_ERROR);
    CHECK(reader_error_type([&] { jsonl.last_n(1); }) ==
          ReaderError::INITIALIZATION_ERROR);
    CHECK(reader_error_type([&] { jsonl.count(); }) ==
          ReaderError::INITIALIZATION_ERROR);
    CHECK(reader_error_type([&] { jsonl.deserialize_values(); }) ==
          ReaderError::INITIALIZATION_ERROR);

    // The reader that took the source is unaffected
    CHECK(lines.collect() == std::vector<std::string>{"a", "b"});
}

TEST_CASE("Jsonl - construction and configuration") {
    CHECK(reader_error_type([] { Jsonl jsonl(std::unique_ptr<Source>{}); }) ==
          ReaderError::INITIALIZATION_ERROR);
    CHECK(reader_error_type([] { Jsonl::from_string("a", 0); }) ==
          ReaderError::INVALID_ARGUMENT);
    CHECK(reader_error_type([] {
              Jsonl::from_path("/nonexistent/dir/events.jsonl");
          }) == ReaderError::FILE_IO_ERROR);

    Jsonl jsonl = Jsonl::from_string("a\nb\nc\n");
    CHECK(jsonl.get_buffer_size() == constants::reader::DEFAULT_BUFFER_SIZE);
    jsonl.set_buffer_size(2);
    CHECK(jsonl.get_buffer_size() == 2);
    CHECK(reader_error_type([&] { jsonl.set_buffer_size(0); }) ==
          ReaderError::INVALID_ARGUMENT);
    CHECK(jsonl.get_buffer_size() == 2);

    ReverseLineReader reader = jsonl.reverse_lines();
    CHECK(reader.capacity() == 2);
    CHECK(reader.collect() == std::vector<std::string>{"c", "b", "a"});
}

TEST_CASE("Jsonl - move transfers the source") {
    Jsonl first = Jsonl::from_string("a\n");
    Jsonl second = std::move(first);
    CHECK(second.is_valid());
    CHECK(second.count() == 1);
}

TEST_CASE("Jsonl - deserialize") {
    std::string data =
        "{\"id\":1,\"name\":\"open\"}\n"
        "{\"id\":2,\"name\"}\n"
        "{\"id\":3,\"name\":\"close\"}\n";

    SUBCASE("Generic values") {
        auto records = Jsonl::from_string(data).deserialize_values();
        std::vector<DecodeResult<json::JsonValue>> results = records.collect();
        REQUIRE(results.size() == 3);
        CHECK(results[0].value().get_string_field("name") == "open");
        CHECK_FALSE(results[1].ok());
        CHECK(results[1].error().get_line_number() == 2);
        CHECK(results[2].value().get_uint64_field("id") == 3);
    }

    SUBCASE("Typed records") {
        Decoder<std::string> names = json::make_decoder<std::string>(
            [](const json::JsonValue &v) { return v.get_string_field("name"); });

        auto head = Jsonl::from_string(data).deserialize_first_n(1, names);
        auto first = head.next();
        REQUIRE(first.has_value());
        CHECK(first->value() == "open");
        CHECK_FALSE(head.next().has_value());

        auto tail = Jsonl::from_string(data).deserialize_last_n(2, names);
        std::vector<DecodeResult<std::string>> results = tail.collect();
        REQUIRE(results.size() == 2);
        CHECK(results[0].value() == "close");
        CHECK_FALSE(results[1].ok());
        CHECK(results[1].error().get_line() == "{\"id\":2,\"name\"}");
    }

    SUBCASE("All lines") {
        Decoder<std::size_t> sizes = [](const std::string &line) {
            return line.size();
        };
        auto records = Jsonl::from_string("ab\nc\n").deserialize(sizes);
        std::vector<DecodeResult<std::size_t>> results = records.collect();
        REQUIRE(results.size() == 2);
        CHECK(results[0].value() == 2);
        CHECK(results[1].value() == 1);
    }
}
