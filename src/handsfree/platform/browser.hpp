#pragma once

#include "error.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

struct PageInfo {
    std::string url;
    std::string title;
};

class BrowserEngine {
public:
    virtual ~BrowserEngine() = default;
    virtual std::expected<PageInfo, Error> open(const std::string& url, const std::string& browser,
                                                bool headless) = 0;
    virtual std::expected<PageInfo, Error> navigate(const std::string& url) = 0;
    // Clicks the first element matching a CSS selector, or else containing text.
    virtual std::expected<void, Error> click(const std::string& selector, const std::string& text,
                                             bool exact) = 0;
    virtual std::expected<void, Error> type(const std::string& selector, const std::string& text,
                                            bool clear, bool enter) = 0;
    virtual std::expected<nlohmann::json, Error> evaluate(const std::string& script) = 0;
};
