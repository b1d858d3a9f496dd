/**
 * @file config.hpp
 * @brief NELF compile-time limits and runtime framing configuration.
 *
 * Wire format handled by the library:
 *
 * @code
 * element    := length SEP content TERM
 * length     := decimal-digit+
 * content    := length bytes of arbitrary data
 * list       := element*
 * @endcode
 */

#ifndef NELF_CONFIG_HPP
#define NELF_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace nelf {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 2;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Largest element length accepted when no runtime limit is configured
#ifndef NELF_MAX_ELEMENT_LENGTH
#define NELF_MAX_ELEMENT_LENGTH SIZE_MAX
#endif

inline constexpr std::size_t MAX_ELEMENT_LENGTH = NELF_MAX_ELEMENT_LENGTH;

inline constexpr std::uint8_t DEFAULT_SEPARATOR = ':';
inline constexpr std::uint8_t DEFAULT_TERMINATOR = ',';

/// Enough room for the decimal digits of any std::size_t (20 for 64-bit)
inline constexpr std::size_t MAX_LENGTH_DIGITS = 20U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define NELF_NO_EXCEPTIONS=1 to compile out the throwing API.
 * @{
 */
#ifndef NELF_NO_EXCEPTIONS
#define NELF_NO_EXCEPTIONS 0
#endif
/** @} */

/**
 * @brief Rule used to check element content when building views.
 */
enum class TextValidity : std::uint8_t {
    Utf8 = 0, ///< Content must be well-formed UTF-8
    None = 1  ///< Content is raw bytes, never checked
};

/**
 * @brief Runtime framing configuration.
 *
 * Defaults describe the standard format. Separator and terminator may be
 * changed to any byte that cannot occur in a length field.
 */
struct Config {
    std::uint8_t separator = DEFAULT_SEPARATOR;         ///< Ends the length field
    std::uint8_t terminator = DEFAULT_TERMINATOR;       ///< Ends the element
    std::size_t max_element_length = MAX_ELEMENT_LENGTH; ///< Largest element length
    std::size_t max_elements = 0;                       ///< Element-count guard (0 = none)
    TextValidity text_validity = TextValidity::Utf8;    ///< Content check for views

    /**
     * @brief Check that the framing bytes can be told apart from digits.
     * @return true if this configuration can frame a list
     */
    [[nodiscard]] constexpr bool valid() const noexcept {
        return !is_digit(separator) && !is_digit(terminator);
    }

    /// True for ASCII '0'-'9'
    static constexpr bool is_digit(std::uint8_t byte) noexcept {
        return byte >= '0' && byte <= '9';
    }
};

} // namespace nelf

#endif // NELF_CONFIG_HPP
