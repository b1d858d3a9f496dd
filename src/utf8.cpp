/**
 * @file utf8.cpp
 * @brief Strict UTF-8 validator.
 *
 * Follows the well-formed byte sequence table of Unicode 15, section 3.9
 * (Table 3-7).
 */

#include <nelf/utf8.hpp>

namespace nelf {

namespace {

inline bool is_continuation(std::uint8_t byte) noexcept {
    return (byte & 0xC0U) == 0x80U;
}

} // namespace

bool validate_utf8(const std::uint8_t* data, std::size_t size, std::size_t& bad_offset) noexcept {
    std::size_t i = 0;

    while (i < size) {
        std::uint8_t lead = data[i];

        // ASCII fast path
        if (lead < 0x80U) [[likely]] {
            ++i;
            continue;
        }

        std::size_t need = 0;
        std::uint8_t lo = 0x80U; // Allowed range of the second byte
        std::uint8_t hi = 0xBFU;

        if (lead >= 0xC2U && lead <= 0xDFU) {
            need = 1;
        } else if (lead == 0xE0U) {
            need = 2;
            lo = 0xA0U; // Overlong
        } else if (lead >= 0xE1U && lead <= 0xECU) {
            need = 2;
        } else if (lead == 0xEDU) {
            need = 2;
            hi = 0x9FU; // Surrogates
        } else if (lead >= 0xEEU && lead <= 0xEFU) {
            need = 2;
        } else if (lead == 0xF0U) {
            need = 3;
            lo = 0x90U; // Overlong
        } else if (lead >= 0xF1U && lead <= 0xF3U) {
            need = 3;
        } else if (lead == 0xF4U) {
            need = 3;
            hi = 0x8FU; // Above U+10FFFF
        } else {
            // 0x80-0xC1 and 0xF5-0xFF never start a sequence
            bad_offset = i;
            return false;
        }

        if (size - i - 1 < need) {
            bad_offset = i;
            return false;
        }

        std::uint8_t second = data[i + 1];
        if (second < lo || second > hi) {
            bad_offset = i;
            return false;
        }

        for (std::size_t k = 2; k <= need; ++k) {
            if (!is_continuation(data[i + k])) {
                bad_offset = i;
                return false;
            }
        }

        i += need + 1;
    }

    return true;
}

} // namespace nelf
