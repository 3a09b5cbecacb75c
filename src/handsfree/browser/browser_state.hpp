#pragma once

#include "error.hpp"

#include <expected>
#include <string>

// Last page visited, so later browser steps (and later runs) continue there.
struct BrowserState {
    std::string url;
    std::string browser = "chromium";

    static BrowserState load(const std::string& path);
    std::expected<void, Error> save(const std::string& path) const;
};
