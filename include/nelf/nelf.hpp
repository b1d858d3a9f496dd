/**
 * @file nelf.hpp
 * @brief High-level NELF API.
 *
 * NELF (No Escape List Format) stores a flat list of byte strings. Every
 * element carries its length up front, so content is never escaped and a
 * decoded element can be returned as a view into the encoded buffer.
 *
 * @code
 * nelf::DecodedList items = nelf::decode_or_throw("5:hello,0:,3:a,b,");
 * // items == {"hello", "", "a,b"}
 * @endcode
 */

#ifndef NELF_HPP
#define NELF_HPP

#include "config.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "framer.hpp"
#include "utf8.hpp"
#include "view.hpp"

namespace nelf {

#if !NELF_NO_EXCEPTIONS

/**
 * @brief Decode a buffer, throwing on malformed input.
 *
 * @param buffer Encoded list; must outlive the returned views
 * @param config Framing bytes, limits and text rule
 * @return Element views in document order
 * @throws ConfigException if the configuration is unusable
 * @throws DecodeException on the first malformed construct
 */
inline DecodedList decode_or_throw(std::string_view buffer, const Config& config = Config{}) {
    if (!config.valid()) {
        throw ConfigException("Separator and terminator must not be decimal digits");
    }

    DecodedList elements;
    ParseError error;
    if (decode(buffer, elements, error, config) != Error::Ok) {
        throw DecodeException(error);
    }
    return elements;
}

/**
 * @brief Encode a sequence of strings, throwing if an element is too large.
 *
 * @tparam Range Iterable of string-like values
 * @param elements Elements in list order
 * @param config Framing bytes and maximum element length
 * @return Encoded bytes
 * @throws ConfigException if the configuration is unusable
 * @throws EncodeException if an element exceeds the maximum length
 */
template <typename Range>
std::vector<std::uint8_t> encode_or_throw(const Range& elements, const Config& config = Config{}) {
    if (!config.valid()) {
        throw ConfigException("Separator and terminator must not be decimal digits");
    }

    std::vector<std::uint8_t> output;
    output.reserve(encoded_size(elements));

    ParseError error;
    if (encode(elements, output, error, config) != Error::Ok) {
        throw EncodeException(error);
    }
    return output;
}

/**
 * @brief Encode a braced list of strings, throwing if an element is too large.
 */
inline std::vector<std::uint8_t> encode_or_throw(std::initializer_list<std::string_view> elements,
                                                 const Config& config = Config{}) {
    return encode_or_throw<std::initializer_list<std::string_view>>(elements, config);
}

#endif // !NELF_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "0.2.0";
}

} // namespace nelf

#endif // NELF_HPP
