#include <catch2/catch_test_macros.hpp>

#include "browser/browser_state.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

struct TmpDir {
    std::filesystem::path dir;

    TmpDir() {
        dir = std::filesystem::temp_directory_path() / ("hf_test_browser_" + std::to_string(getpid()));
    }

    ~TmpDir() { std::filesystem::remove_all(dir); }
};

} // namespace

TEST_CASE("BrowserState", "[browser]") {
    TmpDir tmp;
    auto path = (tmp.dir / "state" / "browser.json").string();

    SECTION("MissingFileGivesDefaults") {
        auto state = BrowserState::load(path);
        REQUIRE(state.url.empty());
        REQUIRE(state.browser == "chromium");
    }

    SECTION("SaveThenLoad") {
        BrowserState state{.url = "https://example.com/login", .browser = "chrome"};
        REQUIRE(state.save(path));

        auto loaded = BrowserState::load(path);
        REQUIRE(loaded.url == "https://example.com/login");
        REQUIRE(loaded.browser == "chrome");
    }

    SECTION("CorruptFileGivesDefaults") {
        std::filesystem::create_directories(tmp.dir / "state");
        std::ofstream(path) << "{ not json";

        auto state = BrowserState::load(path);
        REQUIRE(state.url.empty());
        REQUIRE(state.browser == "chromium");
    }
}
