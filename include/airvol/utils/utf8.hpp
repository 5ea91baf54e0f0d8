/**
 * @file utf8.hpp
 * @brief UTF-8 validation for frames that arrive as binary.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/utils/export.hpp"

#include <string>

namespace airvol {
namespace utils {

/**
 * @brief Check that @p data is well-formed UTF-8.
 *
 * Rejects overlong encodings, UTF-16 surrogates and code points above
 * U+10FFFF. An empty string is valid.
 */
AIRVOL_UTILS_API bool isValidUtf8(const std::string& data);

}  // namespace utils
}  // namespace airvol
