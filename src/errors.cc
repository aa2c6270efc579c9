#include "evalbox/errors.hh"
#include "evalbox/concat_tostr.hh"

#include <algorithm>
#include <cstring>

namespace evalbox {

AccessDenied::AccessDenied(Kind kind, std::string_view details)
: Error{concat_tostr(kind_name(kind), " access denied: ", details)}
, kind_{kind} {}

std::string_view AccessDenied::details() const noexcept {
    std::string_view msg = what();
    auto prefix_len = std::strlen(kind_name(kind_)) + std::strlen(" access denied: ");
    return msg.substr(std::min(prefix_len, msg.size()));
}

const char* AccessDenied::kind_name(Kind kind) noexcept {
    switch (kind) {
    case Kind::READ: return "read";
    case Kind::WRITE: return "write";
    case Kind::EXECUTE: return "execute";
    case Kind::NETWORK: return "network";
    }
    return "unknown";
}

std::optional<AccessDenied::Kind> AccessDenied::kind_from_byte(uint8_t byte) noexcept {
    switch (static_cast<Kind>(byte)) {
    case Kind::READ:
    case Kind::WRITE:
    case Kind::EXECUTE:
    case Kind::NETWORK: return static_cast<Kind>(byte);
    }
    return std::nullopt;
}

} // namespace evalbox
