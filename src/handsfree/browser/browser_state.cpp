#include "browser/browser_state.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;
namespace fs = std::filesystem;

BrowserState BrowserState::load(const std::string& path) {
    BrowserState state;

    std::ifstream file(path);
    if (!file) return state;

    try {
        auto j = json::parse(file);
        state.url = j.value("url", "");
        state.browser = j.value("browser", state.browser);
    } catch (const json::exception& e) {
        std::println(stderr, "browser: ignoring state file {}: {}", path, e.what());
        return BrowserState{};
    }
    return state;
}

std::expected<void, Error> BrowserState::save(const std::string& path) const {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    if (ec) return fail(ErrorKind::Io, "cannot create " + p.parent_path().string() + ": " + ec.message());

    std::ofstream file(path, std::ios::trunc);
    if (!file) return fail(ErrorKind::Io, "cannot write " + path);

    file << json{{"url", url}, {"browser", browser}}.dump(2) << '\n';
    if (!file) return fail(ErrorKind::Io, "write failed: " + path);
    return {};
}
