#ifndef JSONL_UTILS_UTILS_JSON_H
#define JSONL_UTILS_UTILS_JSON_H

#include <simdjson.h>

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace jsonl::utils::json {
using JsonParser = simdjson::dom::parser;
using JsonElement = simdjson::dom::element;

/**
 * A parsed JSON text. Owns the parser its DOM lives in, so copies stay
 * valid independently of the line they were parsed from.
 */
class JsonValue {
   public:
    /**
     * @throws simdjson::simdjson_error if text is not a single JSON value
     */
    static JsonValue parse(std::string_view text);

    const JsonElement &root() const { return root_; }

    bool is_object() const { return root_.is_object(); }
    bool has_field(const std::string &key) const;

    // Field accessors return an empty/zero value when the key is missing
    // or holds an incompatible type. Numeric accessors also accept numbers
    // encoded as strings.
    std::string get_string_field(const std::string &key) const;
    double get_double_field(const std::string &key) const;
    std::uint64_t get_uint64_field(const std::string &key) const;
    std::int64_t get_int64_field(const std::string &key) const;
    bool get_bool_field(const std::string &key) const;

    /**
     * Minified JSON text
     */
    std::string to_string() const;

   private:
    JsonValue(std::shared_ptr<JsonParser> parser, JsonElement root)
        : parser_(std::move(parser)), root_(root) {}

    std::shared_ptr<JsonParser> parser_;
    JsonElement root_;
};

std::ostream &operator<<(std::ostream &os, const JsonValue &value);

/**
 * Line decoder producing JsonValue
 */
JsonValue decode_value(const std::string &line);

/**
 * Build a line decoder from a mapping over the parsed value, e.g.
 * make_decoder<Event>([](const JsonValue &v) { return Event{...}; })
 */
template <typename T>
std::function<T(const std::string &)> make_decoder(
    std::function<T(const JsonValue &)> mapping) {
    return [mapping = std::move(mapping)](const std::string &line) {
        return mapping(JsonValue::parse(line));
    };
}

}  // namespace jsonl::utils::json

#endif  // JSONL_UTILS_UTILS_JSON_H
