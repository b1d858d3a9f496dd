/**
 * @file error.hpp
 * @brief NELF error handling.
 *
 * Every failure is an Error code plus the absolute byte offset where it was
 * detected. The code-based API works with -fno-exceptions; the exception
 * classes below wrap the same information for callers that prefer throwing.
 */

#ifndef NELF_ERROR_HPP
#define NELF_ERROR_HPP

#include "config.hpp"

#if !NELF_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace nelf {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,                 ///< Success
    MalformedLength = -1,   ///< Non-digit where a length digit was expected
    LengthOverflow = -2,    ///< Length exceeds the configured maximum
    MissingSeparator = -3,  ///< Length field not followed by the separator
    TruncatedContent = -4,  ///< Declared length runs past the buffer end
    MissingTerminator = -5, ///< Content not followed by the terminator
    InvalidEncoding = -6,   ///< Content fails the configured text rule
    ElementTooLarge = -7,   ///< Encoder input exceeds the maximum length
    TooManyElements = -8,   ///< Element-count guard exceeded
    InvalidConfig = -9,     ///< Separator or terminator is a digit
    InvalidArg = -10        ///< Span or argument outside the buffer
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::MalformedLength:
        return "Malformed length field";
    case Error::LengthOverflow:
        return "Length exceeds maximum element length";
    case Error::MissingSeparator:
        return "Missing separator after length";
    case Error::TruncatedContent:
        return "Content truncated by end of buffer";
    case Error::MissingTerminator:
        return "Missing terminator after content";
    case Error::InvalidEncoding:
        return "Content is not valid text";
    case Error::ElementTooLarge:
        return "Element exceeds maximum element length";
    case Error::TooManyElements:
        return "Too many elements";
    case Error::InvalidConfig:
        return "Invalid framing configuration";
    case Error::InvalidArg:
        return "Invalid argument";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Positioned error value.
 *
 * For decoding, offset is relative to the start of the source buffer. For
 * encoding, it is the output offset at which the rejected element would
 * have started.
 */
struct ParseError {
    Error code = Error::Ok; ///< What went wrong
    std::size_t offset = 0; ///< Absolute byte offset of the failure

    [[nodiscard]] bool ok() const noexcept { return code == Error::Ok; }

    [[nodiscard]] const char* message() const noexcept { return error_string(code); }
};

#if !NELF_NO_EXCEPTIONS

/**
 * @brief Base exception for NELF errors.
 */
class NelfException : public std::runtime_error {
public:
    explicit NelfException(const std::string& message, Error code = Error::InvalidArg,
                           std::size_t offset = 0)
        : std::runtime_error(message), error_code_(code), offset_(offset) {}

    Error code() const noexcept {
        return error_code_;
    }

    std::size_t offset() const noexcept {
        return offset_;
    }

private:
    Error error_code_;
    std::size_t offset_;
};

/**
 * @brief Exception for malformed input found while decoding.
 */
class DecodeException : public NelfException {
public:
    explicit DecodeException(const ParseError& error)
        : NelfException(std::string(error.message()) + " at offset " +
                            std::to_string(error.offset),
                        error.code, error.offset) {}
};

/**
 * @brief Exception for elements the encoder cannot represent.
 */
class EncodeException : public NelfException {
public:
    explicit EncodeException(const ParseError& error)
        : NelfException(std::string(error.message()) + " at output offset " +
                            std::to_string(error.offset),
                        error.code, error.offset) {}
};

/**
 * @brief Exception for an unusable Config.
 */
class ConfigException : public NelfException {
public:
    explicit ConfigException(const std::string& message)
        : NelfException(message, Error::InvalidConfig) {}
};

#endif // !NELF_NO_EXCEPTIONS

} // namespace nelf

#endif // NELF_ERROR_HPP
