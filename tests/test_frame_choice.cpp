#include <catch2/catch_test_macros.hpp>

#include "platform/frame_choice.hpp"

namespace {

WindowInfo window(std::string title, int pid) {
    WindowInfo w;
    w.handle = 1;
    w.title = std::move(title);
    w.pid = pid;
    return w;
}

} // namespace

TEST_CASE("FrameChoice", "[frames]") {

    SECTION("ExactTitleWithinPid") {
        std::vector<FrameCandidate> frames{{10, "Notes"}, {20, "Notes"}, {20, "Settings"}};
        REQUIRE(choose_frame(frames, window("Notes", 20)) == 1);
        REQUIRE(choose_frame(frames, window("Settings", 20)) == 2);
    }

    SECTION("ExactTitleWithoutPid") {
        std::vector<FrameCandidate> frames{{10, "Notes"}, {20, "Settings"}};
        REQUIRE(choose_frame(frames, window("Settings", 0)) == 1);
        REQUIRE_FALSE(choose_frame(frames, window("Other", 0)));
    }

    SECTION("OtherTitledFrameOfMultiWindowAppIsRejected") {
        std::vector<FrameCandidate> frames{{20, "Main window"}, {20, "Preferences"}};
        REQUIRE_FALSE(choose_frame(frames, window("Untitled document", 20)));
    }

    SECTION("UntitledFrameOfSamePid") {
        std::vector<FrameCandidate> frames{{20, "Main window"}, {20, ""}};
        REQUIRE(choose_frame(frames, window("Renamed by the app", 20)) == 1);
    }

    SECTION("OnlyFrameOfSamePid") {
        std::vector<FrameCandidate> frames{{10, "Else"}, {20, "gedit"}};
        REQUIRE(choose_frame(frames, window("Untitled - gedit", 20)) == 1);
    }

    SECTION("NoFrames") {
        REQUIRE_FALSE(choose_frame({}, window("Anything", 20)));
    }
}
