/**
 * @file decoder.hpp
 * @brief Decoding of a whole list into borrowed element views.
 *
 * Decoding is framing followed by view building for each element, stopping
 * at the first error of either stage. The Reader performs both stages
 * lazily, one element per call; decode() drives a Reader over the whole
 * buffer.
 */

#ifndef NELF_DECODER_HPP
#define NELF_DECODER_HPP

#include "config.hpp"
#include "error.hpp"
#include "framer.hpp"
#include "view.hpp"

#include <string_view>
#include <vector>

namespace nelf {

/// Elements of one list in document order, borrowing from the source buffer
using DecodedList = std::vector<std::string_view>;

/**
 * @brief Lazy element reader.
 *
 * Borrows the source buffer and yields one view per call. Views returned by
 * next() point into the source buffer, not into the reader, so they stay
 * valid after the reader is destroyed as long as the buffer lives.
 */
class Reader {
public:
    /**
     * @brief Construct a reader.
     *
     * @param data Pointer to the source buffer
     * @param size Number of bytes in the buffer
     * @param config Framing bytes, limits and text rule
     */
    Reader(const std::uint8_t* data, std::size_t size, const Config& config = Config{}) noexcept
        : data_(data), size_(size), framer_(data, size, config), error_(framer_.error()) {}

    explicit Reader(std::string_view buffer, const Config& config = Config{}) noexcept
        : Reader(reinterpret_cast<const std::uint8_t*>(buffer.data()), buffer.size(), config) {}

    /**
     * @brief Read the next element.
     *
     * @param[out] element View of the element content
     * @return Error::Ok on success, otherwise the error also held by error()
     */
    Error next(std::string_view& element) noexcept;

    /// True once the buffer is consumed or an error occurred
    [[nodiscard]] bool at_end() const noexcept {
        return framer_.at_end() || !error_.ok();
    }

    /// Number of elements read so far
    [[nodiscard]] std::size_t count() const noexcept { return count_; }

    /// Offset of the next unread byte
    [[nodiscard]] std::size_t position() const noexcept { return framer_.position(); }

    /// First error encountered, or an Ok value
    [[nodiscard]] const ParseError& error() const noexcept { return error_; }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    Framer framer_;
    ParseError error_;
    std::size_t count_ = 0;
};

/**
 * @brief Decode a whole buffer.
 *
 * Views are appended to @p elements in document order. Elements decoded
 * before a failure remain in @p elements.
 *
 * @param data Source buffer
 * @param size Buffer size in bytes
 * @param[out] elements Destination for element views (appended)
 * @param[out] error Kind and offset of the first error
 * @param config Framing bytes, limits and text rule
 * @return Error::Ok on success
 */
Error decode(const std::uint8_t* data, std::size_t size, DecodedList& elements,
             ParseError& error, const Config& config = Config{});

/**
 * @brief Decode a whole string buffer.
 */
inline Error decode(std::string_view buffer, DecodedList& elements, ParseError& error,
                    const Config& config = Config{}) {
    return decode(reinterpret_cast<const std::uint8_t*>(buffer.data()), buffer.size(), elements,
                  error, config);
}

} // namespace nelf

#endif // NELF_DECODER_HPP
