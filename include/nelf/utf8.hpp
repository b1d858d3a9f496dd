/**
 * @file utf8.hpp
 * @brief Strict UTF-8 validation for element content.
 *
 * Rejects overlong forms, UTF-16 surrogates (U+D800-U+DFFF), code points
 * above U+10FFFF and truncated sequences.
 */

#ifndef NELF_UTF8_HPP
#define NELF_UTF8_HPP

#include "config.hpp"

namespace nelf {

/**
 * @brief Validate a byte range as UTF-8.
 *
 * @param data Bytes to check
 * @param size Number of bytes
 * @param[out] bad_offset Offset (relative to data) of the first byte of the
 *             offending sequence; untouched on success
 * @return true if the whole range is well-formed UTF-8
 */
bool validate_utf8(const std::uint8_t* data, std::size_t size, std::size_t& bad_offset) noexcept;

/**
 * @brief Validate a byte range as UTF-8.
 *
 * @param data Bytes to check
 * @param size Number of bytes
 * @return true if the whole range is well-formed UTF-8
 */
inline bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept {
    std::size_t unused = 0;
    return validate_utf8(data, size, unused);
}

} // namespace nelf

#endif // NELF_UTF8_HPP
