#pragma once

#include <expected>
#include <string>

enum class ErrorKind {
    NotFound,          // window descriptor matched nothing
    DetachedElement,   // ancestor walk never reached the window root
    Unresolvable,      // every target candidate failed
    NoActiveWindow,    // classic-mode step before any focus
    UnknownAction,     // macro names an action outside the vocabulary
    InjectionFailure,  // OS declined to inject input
    InvalidMacro,
    InvalidSelector,
    LookupFailed,      // a single lookup (candidate, hop, query) found nothing usable
    BrowserFailure,
    Io,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

const char* to_string(ErrorKind kind);

// "Kind: message"
std::string describe(const Error& error);

inline std::unexpected<Error> fail(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}
