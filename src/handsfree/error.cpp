#include "error.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::DetachedElement: return "DetachedElement";
        case ErrorKind::Unresolvable: return "Unresolvable";
        case ErrorKind::NoActiveWindow: return "NoActiveWindow";
        case ErrorKind::UnknownAction: return "UnknownAction";
        case ErrorKind::InjectionFailure: return "InjectionFailure";
        case ErrorKind::InvalidMacro: return "InvalidMacro";
        case ErrorKind::InvalidSelector: return "InvalidSelector";
        case ErrorKind::LookupFailed: return "LookupFailed";
        case ErrorKind::BrowserFailure: return "BrowserFailure";
        case ErrorKind::Io: return "Io";
    }
    return "Unknown";
}

std::string describe(const Error& error) {
    if (error.message.empty()) return to_string(error.kind);
    return std::string(to_string(error.kind)) + ": " + error.message;
}
