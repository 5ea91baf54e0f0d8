/**
 * @file json_codec.hpp
 * @brief JSON helpers on top of protobuf's JSON utilities.
 *
 * Inbound documents (announces, volume frames) are parsed into a
 * google::protobuf::Struct and inspected field by field, since devices send
 * numbers both as JSON numbers and as strings. Outbound documents are typed
 * messages from wire.proto rendered with their original field names.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/core/export.hpp"

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

#include <initializer_list>
#include <optional>
#include <string>

namespace airvol {
namespace core {
namespace json {

/**
 * @brief Parse @p text as a JSON object.
 * @param error Optional output for the parser's diagnostic.
 * @return False if @p text is not valid JSON or not an object.
 */
AIRVOL_CORE_API bool parseObject(const std::string& text,
                                 google::protobuf::Struct& out,
                                 std::string* error = nullptr);

/**
 * @brief Return the first of @p keys present in @p object, or nullptr.
 *
 * A key holding JSON null counts as absent.
 */
AIRVOL_CORE_API const google::protobuf::Value* firstField(
    const google::protobuf::Struct& object,
    std::initializer_list<const char*> keys);

/**
 * @brief Numeric view of a value: a finite JSON number, or a string holding one.
 *
 * Surrounding whitespace in strings is ignored; anything else after the
 * number makes the string non-numeric.
 */
AIRVOL_CORE_API std::optional<double> asNumber(const google::protobuf::Value& value);

/**
 * @brief String view of a value; nullopt unless it is a JSON string.
 */
AIRVOL_CORE_API std::optional<std::string> asString(const google::protobuf::Value& value);

/**
 * @brief Render a message as compact JSON with proto field names.
 * @return False if the printer rejected the message.
 */
AIRVOL_CORE_API bool render(const google::protobuf::Message& message, std::string& out);

/**
 * @brief Compact rendering of a parsed object, for log lines.
 */
AIRVOL_CORE_API std::string describe(const google::protobuf::Struct& object);

}  // namespace json
}  // namespace core
}  // namespace airvol
