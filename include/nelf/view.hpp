/**
 * @file view.hpp
 * @brief Zero-copy element views over a source buffer.
 *
 * A view is a std::string_view pointing into the source buffer. It is only
 * valid while that buffer is alive and unmodified; nothing here extends the
 * buffer's lifetime or copies its bytes.
 */

#ifndef NELF_VIEW_HPP
#define NELF_VIEW_HPP

#include "config.hpp"
#include "error.hpp"
#include "framer.hpp"
#include "utf8.hpp"

#include <string_view>

namespace nelf {

/**
 * @brief Build the view of one framed element.
 *
 * Text validity is checked here rather than while framing, so callers that
 * only need raw bytes can pass TextValidity::None and skip the check.
 *
 * @param data Source buffer the span was framed from
 * @param size Buffer size in bytes
 * @param span Element coordinates
 * @param[out] element View of the content; untouched on error
 * @param[out] error InvalidEncoding at the absolute offset of the first bad
 *             byte, or InvalidArg if the span does not lie inside the buffer
 * @param validity Content rule
 * @return Error::Ok on success
 */
inline Error view(const std::uint8_t* data, std::size_t size, const ElementSpan& span,
                  std::string_view& element, ParseError& error,
                  TextValidity validity = TextValidity::Utf8) noexcept {
    if (span.start > size || span.length > size - span.start) [[unlikely]] {
        error.code = Error::InvalidArg;
        error.offset = span.start;
        return error.code;
    }

    // An empty buffer may come with a null pointer
    const std::uint8_t* content = (data == nullptr) ? data : data + span.start;

    if (validity == TextValidity::Utf8) {
        std::size_t bad = 0;
        if (!validate_utf8(content, span.length, bad)) {
            error.code = Error::InvalidEncoding;
            error.offset = span.start + bad;
            return error.code;
        }
    }

    element = std::string_view(reinterpret_cast<const char*>(content), span.length);
    return Error::Ok;
}

/**
 * @brief Build the view of one framed element of a string buffer.
 */
inline Error view(std::string_view buffer, const ElementSpan& span, std::string_view& element,
                  ParseError& error, TextValidity validity = TextValidity::Utf8) noexcept {
    return view(reinterpret_cast<const std::uint8_t*>(buffer.data()), buffer.size(), span,
                element, error, validity);
}

} // namespace nelf

#endif // NELF_VIEW_HPP
