#include <catch2/catch_test_macros.hpp>

#include "recorder/capture_session.hpp"

using namespace std::chrono_literals;
using Clock = CaptureSession::Clock;

namespace {

Selector ok_button() {
    Selector sel;
    sel.window.title = "Dialog";
    sel.targets.push_back(TargetCandidate::by_name("OK", "push button"));
    return sel;
}

} // namespace

TEST_CASE("CaptureSession", "[capture]") {
    CaptureSession session;
    auto t0 = Clock::now();

    SECTION("TypingThenEnterIsOneStep") {
        session.on_printable("h", t0);
        session.on_printable("i", t0 + 10ms);
        session.on_enter(t0 + 20ms);

        auto steps = session.steps();
        REQUIRE(steps.size() == 1);
        REQUIRE(steps[0].action == "type");
        REQUIRE(steps[0].args["text"] == "hi");
        REQUIRE(steps[0].args["enter"] == true);
        REQUIRE(steps[0].args["selector_candidates"].empty());
        REQUIRE(steps[0].args["timeout"] == 20);
        REQUIRE(session.pending_text().empty());
    }

    SECTION("TypingEnterThenClickIsTypeThenClick") {
        session.on_printable("h", t0);
        session.on_printable("i", t0 + 10ms);
        session.on_enter(t0 + 20ms);
        session.on_click(300, 400, std::nullopt, t0 + 500ms);

        auto steps = session.steps();
        REQUIRE(steps.size() == 2);
        REQUIRE(steps[0].action == "type");
        REQUIRE(steps[0].args["text"] == "hi");
        REQUIRE(steps[0].args["enter"] == true);
        REQUIRE(steps[1].action == "click");
        REQUIRE(steps[1].args["x"] == 300);
        REQUIRE(steps[1].args["delay_before"] == 480);
    }

    SECTION("KeysDuringLookupFollowTheClick") {
        session.on_printable("a", t0);
        session.on_press(t0 + 100ms);
        REQUIRE(session.steps().size() == 1);

        session.on_printable("h", t0 + 150ms);
        session.on_printable("i", t0 + 160ms);
        session.on_enter(t0 + 170ms);
        REQUIRE(session.steps().size() == 1);
        REQUIRE_FALSE(session.on_idle_tick(t0 + 10s));

        session.on_click(140, 215, ok_button(), t0 + 900ms);

        auto steps = session.steps();
        REQUIRE(steps.size() == 3);
        REQUIRE(steps[0].action == "type");
        REQUIRE(steps[0].args["text"] == "a");
        REQUIRE(steps[1].action == "click");
        // Stamped at the press, not when the lookup finished.
        REQUIRE(steps[1].args["delay_before"] == 0);
        REQUIRE(steps[2].action == "type");
        REQUIRE(steps[2].args["text"] == "hi");
        REQUIRE(steps[2].args["enter"] == true);
        REQUIRE(steps[2].args["selector_candidates"][0] == selector::encode(ok_button()));
        REQUIRE(steps[2].args["delay_before"] == 70);
    }

    SECTION("StopDuringLookupKeepsHeldKeys") {
        session.on_press(t0);
        session.on_printable("z", t0 + 10ms);
        session.on_stop(t0 + 20ms);

        auto steps = session.steps();
        REQUIRE(steps.size() == 1);
        REQUIRE(steps[0].action == "type");
        REQUIRE(steps[0].args["text"] == "z");
    }

    SECTION("ClickCarriesSelectorIntoLaterTyping") {
        session.on_click(140, 215, ok_button(), t0);
        session.on_printable("x", t0 + 100ms);
        session.on_other_key(t0 + 200ms);

        auto steps = session.steps();
        REQUIRE(steps.size() == 2);
        REQUIRE(steps[0].action == "click");
        REQUIRE(steps[0].args["x"] == 140);
        REQUIRE(steps[0].args["y"] == 215);
        REQUIRE(steps[0].args["selector_candidates"].size() == 1);
        REQUIRE(steps[0].args["selector_candidates"][0] == selector::encode(ok_button()));

        REQUIRE(steps[1].action == "type");
        REQUIRE(steps[1].args["text"] == "x");
        REQUIRE(steps[1].args["enter"] == false);
        REQUIRE(steps[1].args["selector_candidates"][0] == selector::encode(ok_button()));
    }

    SECTION("FailedLookupKeepsCoordinatesOnly") {
        session.on_click(140, 215, ok_button(), t0);
        session.on_click(5, 6, std::nullopt, t0 + 1s);
        session.on_printable("a", t0 + 2s);
        session.on_enter(t0 + 3s);

        auto steps = session.steps();
        REQUIRE(steps.size() == 3);
        REQUIRE_FALSE(steps[1].args.contains("selector_candidates"));
        REQUIRE(steps[2].args["selector_candidates"].empty());
    }

    SECTION("ClickFlushesPendingText") {
        session.on_printable("abc", t0);
        session.on_click(1, 2, std::nullopt, t0 + 50ms);

        auto steps = session.steps();
        REQUIRE(steps.size() == 2);
        REQUIRE(steps[0].action == "type");
        REQUIRE(steps[0].args["text"] == "abc");
        REQUIRE(steps[1].action == "click");
    }

    SECTION("IdleFlush") {
        session.on_printable("a", t0);
        REQUIRE_FALSE(session.on_idle_tick(t0 + 1000ms));
        REQUIRE(session.on_idle_tick(t0 + 1600ms));
        REQUIRE(session.steps().size() == 1);
        REQUIRE(session.steps()[0].args["text"] == "a");
        REQUIRE_FALSE(session.on_idle_tick(t0 + 5s));
    }

    SECTION("EnterOnEmptyBufferStillRecords") {
        session.on_enter(t0);
        auto steps = session.steps();
        REQUIRE(steps.size() == 1);
        REQUIRE(steps[0].args["text"] == "");
        REQUIRE(steps[0].args["enter"] == true);
    }

    SECTION("OtherKeyOnEmptyBufferRecordsNothing") {
        session.on_other_key(t0);
        REQUIRE(session.steps().empty());
    }

    SECTION("DelayBeforeIsTimeSincePreviousStep") {
        session.on_click(1, 1, std::nullopt, t0);
        session.on_click(2, 2, std::nullopt, t0 + 750ms);
        session.on_click(3, 3, std::nullopt, t0 + 2s);

        auto steps = session.steps();
        REQUIRE(steps[0].args["delay_before"] == 0);
        REQUIRE(steps[1].args["delay_before"] == 750);
        REQUIRE(steps[2].args["delay_before"] == 1250);
    }

    SECTION("StopFlushesAndIgnoresLaterEvents") {
        session.on_printable("tail", t0);
        session.on_stop(t0 + 10ms);
        REQUIRE(session.stopped());

        session.on_click(1, 1, std::nullopt, t0 + 20ms);
        session.on_printable("x", t0 + 30ms);
        session.on_enter(t0 + 40ms);

        auto steps = session.take_steps();
        REQUIRE(steps.size() == 1);
        REQUIRE(steps[0].args["text"] == "tail");
        REQUIRE(session.steps().empty());
    }

    SECTION("RecordedStepsDecodeAsMacro") {
        session.on_click(10, 10, ok_button(), t0);
        session.on_printable("z", t0 + 10ms);
        session.on_stop(t0 + 20ms);

        auto decoded = macro::decode(macro::encode(session.steps()));
        REQUIRE(decoded);
        REQUIRE(decoded->size() == 2);
    }
}
