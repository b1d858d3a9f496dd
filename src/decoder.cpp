/**
 * @file decoder.cpp
 * @brief Reader and whole-buffer decoding.
 */

#include <nelf/decoder.hpp>

namespace nelf {

Error Reader::next(std::string_view& element) noexcept {
    if (!error_.ok()) {
        return error_.code;
    }

    ElementSpan span;
    auto result = framer_.next(span);
    if (result != Error::Ok) {
        // Past the end is a usage error, not a property of the input
        if (framer_.error().ok()) {
            return result;
        }
        error_ = framer_.error();
        return result;
    }

    result = view(data_, size_, span, element, error_, framer_.config().text_validity);
    if (result != Error::Ok) {
        return result;
    }

    ++count_;
    return Error::Ok;
}

Error decode(const std::uint8_t* data, std::size_t size, DecodedList& elements,
             ParseError& error, const Config& config) {
    Reader reader(data, size, config);
    error = reader.error();
    if (!error.ok()) {
        return error.code;
    }

    std::string_view element;
    while (!reader.at_end()) {
        if (reader.next(element) != Error::Ok) {
            error = reader.error();
            return error.code;
        }
        elements.push_back(element);
    }

    return Error::Ok;
}

} // namespace nelf
