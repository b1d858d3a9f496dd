/**
 * @file framer.cpp
 * @brief Length-prefix framing.
 */

#include <nelf/framer.hpp>

namespace nelf {

Framer::Framer(const std::uint8_t* data, std::size_t size, const Config& config) noexcept
    : data_(data), size_(size), config_(config), pos_(0), count_(0), error_{} {
    reset();
}

void Framer::reset() noexcept {
    pos_ = 0;
    count_ = 0;
    error_ = ParseError{};

    if (!config_.valid()) {
        fail(Error::InvalidConfig, 0);
    }
}

Error Framer::next(ElementSpan& span) noexcept {
    if (!error_.ok()) {
        return error_.code;
    }
    if (pos_ >= size_) {
        // Nothing left; not a property of the input, so not recorded
        return Error::InvalidArg;
    }

    if (config_.max_elements != 0 && count_ >= config_.max_elements) {
        return fail(Error::TooManyElements, pos_);
    }

    std::size_t cursor = pos_;

    // Length field: at least one digit
    if (!Config::is_digit(data_[cursor])) {
        return fail(Error::MalformedLength, cursor);
    }

    const std::size_t max_length = config_.max_element_length;
    std::size_t length = 0;

    while (cursor < size_ && Config::is_digit(data_[cursor])) {
        std::size_t digit = static_cast<std::size_t>(data_[cursor] - '0');

        // length * 10 + digit > max_length, without overflowing size_t
        if (digit > max_length || length > (max_length - digit) / 10U) {
            return fail(Error::LengthOverflow, cursor);
        }

        length = (length * 10U) + digit;
        ++cursor;
    }

    if (cursor >= size_ || data_[cursor] != config_.separator) {
        return fail(Error::MissingSeparator, cursor);
    }
    ++cursor;

    const std::size_t content_start = cursor;
    if (length > size_ - content_start) {
        return fail(Error::TruncatedContent, content_start);
    }

    const std::size_t content_end = content_start + length;
    if (content_end >= size_ || data_[content_end] != config_.terminator) {
        return fail(Error::MissingTerminator, content_end);
    }

    span.start = content_start;
    span.length = length;

    pos_ = content_end + 1;
    ++count_;

    return Error::Ok;
}

Error frame(const std::uint8_t* data, std::size_t size, std::vector<ElementSpan>& spans,
            ParseError& error, const Config& config) {
    Framer framer(data, size, config);
    error = framer.error();
    if (!error.ok()) {
        return error.code;
    }

    ElementSpan span;
    while (!framer.at_end()) {
        if (framer.next(span) != Error::Ok) {
            error = framer.error();
            return error.code;
        }
        spans.push_back(span);
    }

    return Error::Ok;
}

} // namespace nelf
