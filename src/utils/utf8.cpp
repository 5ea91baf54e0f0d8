/**
 * @file utf8.cpp
 * @brief UTF-8 validation.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#include "airvol/utils/utf8.hpp"

#include <cstdint>

namespace airvol {
namespace utils {

bool isValidUtf8(const std::string& data) {
    const auto* p = reinterpret_cast<const uint8_t*>(data.data());
    const auto* end = p + data.size();

    while (p < end) {
        uint8_t lead = *p++;
        if (lead < 0x80) {
            continue;
        }

        int continuation;
        uint32_t codepoint;
        uint32_t minimum;
        if ((lead & 0xE0) == 0xC0) {
            continuation = 1;
            codepoint = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            continuation = 2;
            codepoint = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            continuation = 3;
            codepoint = lead & 0x07;
            minimum = 0x10000;
        } else {
            return false;
        }

        if (end - p < continuation) {
            return false;
        }
        for (int i = 0; i < continuation; ++i) {
            uint8_t byte = *p++;
            if ((byte & 0xC0) != 0x80) {
                return false;
            }
            codepoint = (codepoint << 6) | (byte & 0x3F);
        }

        if (codepoint < minimum || codepoint > 0x10FFFF
            || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return false;
        }
    }
    return true;
}

}  // namespace utils
}  // namespace airvol
