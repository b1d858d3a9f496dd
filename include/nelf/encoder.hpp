/**
 * @file encoder.hpp
 * @brief Serialization of string sequences into framed bytes.
 *
 * Each element is written as its decimal byte length, the separator, the
 * raw content and the terminator. Content is copied verbatim; there is no
 * escaping step, so encoding can only fail when an element is longer than
 * the configured maximum.
 */

#ifndef NELF_ENCODER_HPP
#define NELF_ENCODER_HPP

#include "config.hpp"
#include "error.hpp"

#include <array>
#include <initializer_list>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace nelf {

namespace detail {

/// @name Byte access for the string-like types accepted by the encoder
/// @{
inline std::string_view as_bytes(std::string_view s) noexcept {
    return s;
}

inline std::string_view as_bytes(const std::string& s) noexcept {
    return s;
}

inline std::string_view as_bytes(const char* s) noexcept {
    return (s == nullptr) ? std::string_view() : std::string_view(s);
}

inline std::string_view as_bytes(const std::vector<std::uint8_t>& v) noexcept {
    return {reinterpret_cast<const char*>(v.data()), v.size()};
}

template <std::size_t N>
std::string_view as_bytes(const std::array<std::uint8_t, N>& a) noexcept {
    return {reinterpret_cast<const char*>(a.data()), N};
}
/// @}

} // namespace detail

/**
 * @brief Number of decimal digits needed to write a length.
 * @param value Length to write
 * @return Digit count (1 for zero)
 */
std::size_t decimal_digits(std::size_t value) noexcept;

/**
 * @brief Encoded size of one element, framing included.
 * @param length Content length in bytes
 */
inline std::size_t element_size(std::size_t length) noexcept {
    return decimal_digits(length) + length + 2U;
}

/**
 * @brief Exact number of bytes encode() will produce for a sequence.
 *
 * @tparam Range Iterable of string-like values
 * @param elements Elements to measure
 * @return Total encoded size in bytes
 */
template <typename Range>
std::size_t encoded_size(const Range& elements) noexcept {
    std::size_t total = 0;
    for (const auto& element : elements) {
        total += element_size(detail::as_bytes(element).size());
    }
    return total;
}

/**
 * @brief Incremental list encoder.
 *
 * Appends framed elements to a caller-provided byte vector. The vector must
 * outlive the encoder. A rejected element leaves the vector untouched and
 * the encoder usable.
 */
class Encoder {
public:
    /**
     * @brief Construct an encoder.
     *
     * @param output Destination bytes; existing content is kept
     * @param config Framing bytes and maximum element length
     */
    explicit Encoder(std::vector<std::uint8_t>& output, const Config& config = Config{}) noexcept
        : output_(output), config_(config) {}

    /**
     * @brief Append one element.
     *
     * @param data Element content
     * @param size Content length in bytes
     * @return Error::Ok, Error::ElementTooLarge or Error::InvalidConfig
     */
    Error append(const std::uint8_t* data, std::size_t size);

    /**
     * @brief Append one string-like element.
     */
    template <typename T> Error append(const T& element) {
        std::string_view bytes = detail::as_bytes(element);
        return append(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
    }

    /**
     * @brief Append every element of a range, all or nothing.
     *
     * If any element is rejected, the output and element count are rolled
     * back to their state before the call.
     *
     * @return Error::Ok on success, otherwise the first element's error
     */
    template <typename Iterator> Error append_all(Iterator first, Iterator last) {
        const std::size_t mark = output_.size();
        const std::size_t count_mark = count_;

        for (; first != last; ++first) {
            auto result = append(*first);
            if (result != Error::Ok) {
                output_.resize(mark);
                count_ = count_mark;
                return result;
            }
        }

        return Error::Ok;
    }

    /// Number of elements appended
    [[nodiscard]] std::size_t count() const noexcept { return count_; }

    /// Current output size in bytes
    [[nodiscard]] std::size_t size() const noexcept { return output_.size(); }

    /// Most recent failure, or an Ok value
    [[nodiscard]] const ParseError& error() const noexcept { return error_; }

private:
    std::vector<std::uint8_t>& output_;
    Config config_;
    std::size_t count_ = 0;
    ParseError error_;
};

/**
 * @brief Encode a sequence of strings.
 *
 * Accepts any iterable of std::string, std::string_view, const char*,
 * std::vector<std::uint8_t> or std::array<std::uint8_t, N>. Output is
 * appended; on failure @p output is left as it was.
 *
 * @tparam Range Iterable of string-like values
 * @param elements Elements in list order
 * @param[out] output Destination bytes (appended)
 * @param[out] error ElementTooLarge with the output offset of the rejected
 *             element, or InvalidConfig
 * @param config Framing bytes and maximum element length
 * @return Error::Ok on success
 */
template <typename Range>
Error encode(const Range& elements, std::vector<std::uint8_t>& output, ParseError& error,
             const Config& config = Config{}) {
    Encoder encoder(output, config);
    auto result = encoder.append_all(std::begin(elements), std::end(elements));
    error = encoder.error();
    return result;
}

/**
 * @brief Encode a braced list of strings.
 */
inline Error encode(std::initializer_list<std::string_view> elements,
                    std::vector<std::uint8_t>& output, ParseError& error,
                    const Config& config = Config{}) {
    Encoder encoder(output, config);
    auto result = encoder.append_all(elements.begin(), elements.end());
    error = encoder.error();
    return result;
}

} // namespace nelf

#endif // NELF_ENCODER_HPP
