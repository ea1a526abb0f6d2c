#pragma once

#include <string>
#include <fmt/format.h>

#include "errors.hpp"

namespace FormFusion {

/// `When binding user.age, conversion error (invalid digit found in string): value 'x'`
inline std::string ErrorToString(const Error& e) {
    std::string where = e.name() ? *e.name() : std::string("form");
    std::string detail;
    if(!e.message().empty()) {
        detail = fmt::format(" ({})", e.message());
    } else if(e.entity() && e.kind() == ErrorKind::Unexpected) {
        detail = fmt::format(" ({})", entity_to_string(*e.entity()));
    }
    if(e.limit()) {
        detail += fmt::format(" [limit {} bytes]", *e.limit());
    }
    std::string value;
    if(e.value()) {
        value = fmt::format(": value '{}'", *e.value());
    }
    return fmt::format("When binding {}, {} error{}{}", where, error_to_string(e.kind()), detail, value);
}

/// One line per error, in reporting order.
inline std::string ErrorsToString(const Errors& errors) {
    std::string out;
    for(const auto& e : errors) {
        if(!out.empty()) out.push_back('\n');
        out += ErrorToString(e);
    }
    return out;
}

} // namespace FormFusion
