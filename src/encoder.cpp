/**
 * @file encoder.cpp
 * @brief Element framing for the encoder.
 */

#include <nelf/encoder.hpp>

namespace nelf {

std::size_t decimal_digits(std::size_t value) noexcept {
    std::size_t digits = 1;
    while (value >= 10U) {
        value /= 10U;
        ++digits;
    }
    return digits;
}

Error Encoder::append(const std::uint8_t* data, std::size_t size) {
    if (!config_.valid()) {
        error_ = ParseError{Error::InvalidConfig, output_.size()};
        return error_.code;
    }
    if (size > config_.max_element_length) {
        error_ = ParseError{Error::ElementTooLarge, output_.size()};
        return error_.code;
    }

    // Digits are produced least significant first
    std::uint8_t digits[MAX_LENGTH_DIGITS];
    std::size_t num_digits = 0;
    std::size_t value = size;
    do {
        digits[num_digits++] = static_cast<std::uint8_t>('0' + (value % 10U));
        value /= 10U;
    } while (value != 0);

    while (num_digits > 0) {
        output_.push_back(digits[--num_digits]);
    }
    output_.push_back(config_.separator);
    if (size > 0) {
        output_.insert(output_.end(), data, data + size);
    }
    output_.push_back(config_.terminator);

    ++count_;
    return Error::Ok;
}

} // namespace nelf
