/**
 * @file framer.hpp
 * @brief Element boundary recognition from length prefixes.
 *
 * The framer walks a source buffer one element at a time and produces
 * ElementSpan coordinates for each element's content. It never looks at
 * the content bytes themselves, which is what makes escaping unnecessary:
 * a content byte equal to the separator, the terminator or a digit is
 * skipped over by length.
 */

#ifndef NELF_FRAMER_HPP
#define NELF_FRAMER_HPP

#include "config.hpp"
#include "error.hpp"

#include <string_view>
#include <vector>

namespace nelf {

/**
 * @brief Byte range of one element's content within the source buffer.
 *
 * Excludes the length prefix, separator and terminator.
 */
struct ElementSpan {
    std::size_t start = 0;  ///< Offset of the first content byte
    std::size_t length = 0; ///< Number of content bytes

    /// Offset one past the last content byte
    [[nodiscard]] constexpr std::size_t end() const noexcept { return start + length; }

    constexpr bool operator==(const ElementSpan& other) const noexcept {
        return start == other.start && length == other.length;
    }

    constexpr bool operator!=(const ElementSpan& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Sequential element framer over a source buffer.
 *
 * Tracks a cursor within the buffer. Each call to next() consumes exactly
 * one element. The first error is sticky: once next() fails, every later
 * call returns the same error and the cursor stays on the offending element.
 *
 * The buffer is borrowed, not copied, and must outlive the framer.
 */
class Framer {
public:
    /**
     * @brief Construct a framer.
     *
     * @param data Pointer to the source buffer (may be null when size is 0)
     * @param size Number of bytes in the buffer
     * @param config Framing bytes and limits
     */
    Framer(const std::uint8_t* data, std::size_t size, const Config& config = Config{}) noexcept;

    /**
     * @brief Construct a framer over a string buffer.
     */
    explicit Framer(std::string_view buffer, const Config& config = Config{}) noexcept
        : Framer(reinterpret_cast<const std::uint8_t*>(buffer.data()), buffer.size(), config) {}

    /**
     * @brief Frame the next element.
     *
     * @param[out] span Coordinates of the element content; untouched on error
     * @return Error::Ok on success, otherwise the error also held by error()
     */
    Error next(ElementSpan& span) noexcept;

    /**
     * @brief True when no further element can be framed.
     *
     * Either the whole buffer has been consumed or an error occurred.
     */
    [[nodiscard]] bool at_end() const noexcept {
        return pos_ >= size_ || !error_.ok();
    }

    /// Offset of the next unread byte
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    /// Bytes left to frame
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (pos_ < size_) ? (size_ - pos_) : 0;
    }

    /// Number of elements framed so far
    [[nodiscard]] std::size_t count() const noexcept { return count_; }

    /// First error encountered, or an Ok value
    [[nodiscard]] const ParseError& error() const noexcept { return error_; }

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    /**
     * @brief Rewind to the start of the buffer and clear any error.
     */
    void reset() noexcept;

private:
    Error fail(Error code, std::size_t offset) noexcept {
        error_.code = code;
        error_.offset = offset;
        return code;
    }

    const std::uint8_t* data_;
    std::size_t size_;
    Config config_;
    std::size_t pos_;
    std::size_t count_;
    ParseError error_;
};

/**
 * @brief Frame a whole buffer.
 *
 * Spans are appended to @p spans in document order. On failure the spans of
 * every element framed before the error remain in @p spans; callers decide
 * whether that prefix is useful.
 *
 * @param data Source buffer
 * @param size Buffer size in bytes
 * @param[out] spans Destination for element spans (appended)
 * @param[out] error Kind and offset of the first error
 * @param config Framing bytes and limits
 * @return Error::Ok on success
 */
Error frame(const std::uint8_t* data, std::size_t size, std::vector<ElementSpan>& spans,
            ParseError& error, const Config& config = Config{});

/**
 * @brief Frame a whole string buffer.
 */
inline Error frame(std::string_view buffer, std::vector<ElementSpan>& spans, ParseError& error,
                   const Config& config = Config{}) {
    return frame(reinterpret_cast<const std::uint8_t*>(buffer.data()), buffer.size(), spans,
                 error, config);
}

} // namespace nelf

#endif // NELF_FRAMER_HPP
