#include <jsonl/utils/utils/json.h>

#include <cerrno>
#include <cstdlib>
#include <ostream>

namespace jsonl::utils::json {

namespace {
bool find_field(const JsonElement &root, const std::string &key,
                JsonElement &field) {
    if (!root.is_object()) return false;
    return root[key].get(field) == simdjson::SUCCESS;
}

bool parse_double(std::string_view text, double &out) {
    std::string buffer(text);
    if (buffer.empty()) return false;
    char *end = nullptr;
    errno = 0;
    out = std::strtod(buffer.c_str(), &end);
    return errno == 0 && end == buffer.c_str() + buffer.size();
}
}  // anonymous namespace

JsonValue JsonValue::parse(std::string_view text) {
    auto parser = std::make_shared<JsonParser>();
    JsonElement root;
    auto error = parser->parse(text.data(), text.size()).get(root);
    if (error) {
        throw simdjson::simdjson_error(error);
    }
    return JsonValue(std::move(parser), root);
}

bool JsonValue::has_field(const std::string &key) const {
    JsonElement field;
    return find_field(root_, key, field);
}

std::string JsonValue::get_string_field(const std::string &key) const {
    JsonElement field;
    if (!find_field(root_, key, field)) return "";

    std::string_view value;
    if (field.get(value) != simdjson::SUCCESS) return "";
    return std::string(value);
}

double JsonValue::get_double_field(const std::string &key) const {
    JsonElement field;
    if (!find_field(root_, key, field)) return 0.0;

    if (field.is_double()) {
        return field.get_double().value_unsafe();
    } else if (field.is_int64()) {
        return static_cast<double>(field.get_int64().value_unsafe());
    } else if (field.is_uint64()) {
        return static_cast<double>(field.get_uint64().value_unsafe());
    } else if (field.is_string()) {
        double value;
        if (parse_double(field.get_string().value_unsafe(), value)) {
            return value;
        }
    }
    return 0.0;
}

std::uint64_t JsonValue::get_uint64_field(const std::string &key) const {
    JsonElement field;
    if (!find_field(root_, key, field)) return 0;

    if (field.is_uint64()) {
        return field.get_uint64().value_unsafe();
    } else if (field.is_int64()) {
        return static_cast<std::uint64_t>(field.get_int64().value_unsafe());
    } else if (field.is_double()) {
        return static_cast<std::uint64_t>(field.get_double().value_unsafe());
    } else if (field.is_string()) {
        double value;
        if (parse_double(field.get_string().value_unsafe(), value) &&
            value >= 0) {
            return static_cast<std::uint64_t>(value);
        }
    }
    return 0;
}

std::int64_t JsonValue::get_int64_field(const std::string &key) const {
    JsonElement field;
    if (!find_field(root_, key, field)) return 0;

    if (field.is_int64()) {
        return field.get_int64().value_unsafe();
    } else if (field.is_uint64()) {
        return static_cast<std::int64_t>(field.get_uint64().value_unsafe());
    } else if (field.is_double()) {
        return static_cast<std::int64_t>(field.get_double().value_unsafe());
    } else if (field.is_string()) {
        double value;
        if (parse_double(field.get_string().value_unsafe(), value)) {
            return static_cast<std::int64_t>(value);
        }
    }
    return 0;
}

bool JsonValue::get_bool_field(const std::string &key) const {
    JsonElement field;
    if (!find_field(root_, key, field)) return false;

    bool value = false;
    if (field.get(value) != simdjson::SUCCESS) return false;
    return value;
}

std::string JsonValue::to_string() const { return simdjson::minify(root_); }

std::ostream &operator<<(std::ostream &os, const JsonValue &value) {
    os << simdjson::minify(value.root());
    return os;
}

JsonValue decode_value(const std::string &line) {
    return JsonValue::parse(line);
}

}  // namespace jsonl::utils::json
