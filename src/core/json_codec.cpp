/**
 * @file json_codec.cpp
 * @brief JSON helper implementation.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#include "airvol/core/json_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <cmath>
#include <locale>
#include <sstream>

namespace airvol {
namespace core {
namespace json {

namespace {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

// Plain decimal or exponent notation, '.' as separator whatever the locale
std::optional<double> parseDecimal(const std::string& text) {
    size_t digits = (text[0] == '+' || text[0] == '-') ? 1 : 0;
    if (text.size() > digits + 1 && text[digits] == '0'
        && (text[digits + 1] == 'x' || text[digits + 1] == 'X')) {
        return std::nullopt;
    }

    std::istringstream in(text);
    in.imbue(std::locale::classic());
    double parsed = 0.0;
    in >> parsed;
    if (in.fail() || in.peek() != std::char_traits<char>::eof() || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace

bool parseObject(const std::string& text,
                 google::protobuf::Struct& out,
                 std::string* error) {
    out.Clear();

    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos || text[first] != '{') {
        if (error) {
            *error = "not a JSON object";
        }
        return false;
    }

    auto status = google::protobuf::util::JsonStringToMessage(text, &out);
    if (!status.ok()) {
        if (error) {
            *error = status.ToString();
        }
        return false;
    }
    return true;
}

const google::protobuf::Value* firstField(const google::protobuf::Struct& object,
                                          std::initializer_list<const char*> keys) {
    const auto& fields = object.fields();
    for (const char* key : keys) {
        auto it = fields.find(key);
        if (it == fields.end()) {
            continue;
        }
        if (it->second.kind_case() == google::protobuf::Value::kNullValue) {
            continue;
        }
        return &it->second;
    }
    return nullptr;
}

std::optional<double> asNumber(const google::protobuf::Value& value) {
    switch (value.kind_case()) {
        case google::protobuf::Value::kNumberValue:
            if (std::isfinite(value.number_value())) {
                return value.number_value();
            }
            return std::nullopt;

        case google::protobuf::Value::kStringValue: {
            std::string trimmed = trim(value.string_value());
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return parseDecimal(trimmed);
        }

        default:
            return std::nullopt;
    }
}

std::optional<std::string> asString(const google::protobuf::Value& value) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) {
        return std::nullopt;
    }
    return value.string_value();
}

bool render(const google::protobuf::Message& message, std::string& out) {
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = false;
    options.preserve_proto_field_names = true;

    out.clear();
    return google::protobuf::util::MessageToJsonString(message, &out, options).ok();
}

std::string describe(const google::protobuf::Struct& object) {
    std::string out;
    if (!render(object, out)) {
        return "<unprintable>";
    }
    return out;
}

}  // namespace json
}  // namespace core
}  // namespace airvol
