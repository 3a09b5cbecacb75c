#include <catch2/catch_test_macros.hpp>

#include "recorder/recorder.hpp"

#include <future>
#include <thread>

using namespace std::chrono_literals;

namespace {

template <typename Source, typename Event>
class FakeSource : public Source {
public:
    bool start(typename Source::Handler h) override {
        if (refuse) return false;
        handler = std::move(h);
        ++starts;
        return true;
    }
    void stop() override { ++stops; }

    void emit(const Event& ev) { handler(ev); }

    typename Source::Handler handler;
    bool refuse = false;
    int starts = 0;
    int stops = 0;
};

using FakePointer = FakeSource<PointerEventSource, PointerEvent>;
using FakeKeys = FakeSource<KeyEventSource, KeyEvent>;

PointerEvent left_press(int x, int y) {
    return PointerEvent{.x = x, .y = y, .button = PointerButton::Left, .pressed = true};
}

KeyEvent printable(std::string text) {
    return KeyEvent{.kind = KeyKind::Printable, .text = std::move(text)};
}

KeyEvent key(KeyKind kind) {
    return KeyEvent{.kind = kind, .text = ""};
}

Selector named(const std::string& name) {
    Selector sel;
    sel.window.title = "Form";
    sel.targets.push_back(TargetCandidate::by_name(name, "entry"));
    return sel;
}

} // namespace

TEST_CASE("Recorder", "[recorder]") {
    FakePointer pointer;
    FakeKeys keys;
    std::vector<std::pair<int, int>> lookups;
    Recorder::SelectorLookup lookup = [&](int x, int y) -> std::optional<Selector> {
        lookups.emplace_back(x, y);
        if (x < 0) return std::nullopt;
        return named("Email");
    };

    SECTION("StopKeyEndsRecording") {
        Recorder rec(pointer, keys, lookup, {});
        REQUIRE(rec.start());

        std::thread listener([&] {
            pointer.emit(left_press(40, 50));
            keys.emit(printable("a"));
            keys.emit(key(KeyKind::Modifier));
            keys.emit(printable("B"));
            keys.emit(key(KeyKind::Enter));
            keys.emit(key(KeyKind::Stop));
        });

        auto steps = rec.wait();
        listener.join();

        REQUIRE(steps.size() == 2);
        REQUIRE(steps[0].action == "click");
        REQUIRE(steps[0].args["selector_candidates"][0] == selector::encode(named("Email")));
        REQUIRE(steps[1].action == "type");
        REQUIRE(steps[1].args["text"] == "aB");
        REQUIRE(steps[1].args["enter"] == true);
        REQUIRE(lookups == std::vector<std::pair<int, int>>{{40, 50}});
        REQUIRE(pointer.stops == 1);
        REQUIRE(keys.stops == 1);
    }

    SECTION("ExternalStopFlushesPendingText") {
        Recorder rec(pointer, keys, lookup, {});
        REQUIRE(rec.start());

        keys.emit(printable("x"));
        std::thread stopper([&] {
            std::this_thread::sleep_for(20ms);
            rec.request_stop();
        });

        auto steps = rec.wait();
        stopper.join();

        REQUIRE(steps.size() == 1);
        REQUIRE(steps[0].args["text"] == "x");
        REQUIRE(rec.session().stopped());
    }

    SECTION("IgnoresOtherButtonsAndReleases") {
        Recorder rec(pointer, keys, lookup, {});
        REQUIRE(rec.start());

        pointer.emit(PointerEvent{.x = 1, .y = 1, .button = PointerButton::Right, .pressed = true});
        pointer.emit(PointerEvent{.x = 1, .y = 1, .button = PointerButton::Left, .pressed = false});
        pointer.emit(left_press(-1, -1));
        rec.request_stop();

        auto steps = rec.wait();
        REQUIRE(steps.size() == 1);
        REQUIRE_FALSE(steps[0].args.contains("selector_candidates"));
    }

    SECTION("EventsAfterStopAreDropped") {
        Recorder rec(pointer, keys, lookup, {});
        REQUIRE(rec.start());

        keys.emit(key(KeyKind::Stop));
        pointer.emit(left_press(3, 3));
        keys.emit(printable("late"));

        auto steps = rec.wait();
        REQUIRE(steps.empty());
        REQUIRE(lookups.empty());
    }

    SECTION("IdleThreadFlushesText") {
        Recorder::Options options;
        options.idle_poll = 10ms;
        options.session.idle_flush = 30ms;
        Recorder rec(pointer, keys, lookup, options);
        REQUIRE(rec.start());

        keys.emit(printable("q"));
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (rec.session().steps().empty() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        REQUIRE(rec.session().steps().size() == 1);
        REQUIRE(rec.session().pending_text().empty());

        rec.request_stop();
        REQUIRE(rec.wait().size() == 1);
    }

    SECTION("TypingDuringSlowLookupFollowsTheClick") {
        std::promise<void> in_lookup;
        std::promise<void> keys_sent;
        auto keys_sent_future = keys_sent.get_future();
        Recorder::SelectorLookup slow = [&](int, int) -> std::optional<Selector> {
            in_lookup.set_value();
            keys_sent_future.wait();
            return named("Field");
        };

        Recorder rec(pointer, keys, slow, {});
        REQUIRE(rec.start());

        std::thread pointer_thread([&] { pointer.emit(left_press(10, 20)); });
        in_lookup.get_future().wait();
        keys.emit(printable("h"));
        keys.emit(printable("i"));
        keys.emit(key(KeyKind::Enter));
        keys_sent.set_value();
        pointer_thread.join();

        rec.request_stop();
        auto steps = rec.wait();

        REQUIRE(steps.size() == 2);
        REQUIRE(steps[0].action == "click");
        REQUIRE(steps[0].args["selector_candidates"][0] == selector::encode(named("Field")));
        REQUIRE(steps[1].action == "type");
        REQUIRE(steps[1].args["text"] == "hi");
        REQUIRE(steps[1].args["enter"] == true);
        REQUIRE(steps[1].args["selector_candidates"][0] == selector::encode(named("Field")));
    }

    SECTION("ZeroIdlePollIsFloored") {
        Recorder::Options options;
        options.idle_poll = 0ms;
        Recorder rec(pointer, keys, lookup, options);
        REQUIRE(rec.options().idle_poll == 1ms);
    }

    SECTION("KeyboardFailureStopsPointer") {
        keys.refuse = true;
        Recorder rec(pointer, keys, lookup, {});
        REQUIRE_FALSE(rec.start());
        REQUIRE(pointer.stops == 1);
    }
}
