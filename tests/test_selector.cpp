#include <catch2/catch_test_macros.hpp>

#include "selector/selector.hpp"

using json = nlohmann::json;

TEST_CASE("Selector codec", "[selector]") {

    SECTION("EncodeDecodeKeepsCandidateOrder") {
        SelectorStep step;
        step.control_type = "push button";
        step.name = "OK";
        step.sibling_index = 2;

        Selector sel;
        sel.window.title = "Settings";
        sel.targets.push_back(TargetCandidate::by_stable_id("okButton", "push button"));
        sel.targets.push_back(TargetCandidate::by_name("OK", "push button"));
        sel.targets.push_back(TargetCandidate::by_path({step}));

        auto back = selector::decode(selector::encode(sel));
        REQUIRE(back);
        REQUIRE(back->window.title == "Settings");
        REQUIRE(back->targets.size() == 3);
        REQUIRE(back->targets[0].kind == TargetCandidate::Kind::StableId);
        REQUIRE(back->targets[1].kind == TargetCandidate::Kind::Name);
        REQUIRE(back->targets[2].kind == TargetCandidate::Kind::Path);
        REQUIRE(back->targets[2].path.size() == 1);
        REQUIRE(back->targets[2].path[0].sibling_index == 2);
        REQUIRE_FALSE(back->targets[2].path[0].stable_id.has_value());
    }

    SECTION("WindowFieldsAreOmittedWhenUnset") {
        WindowDescriptor w;
        w.title_regex = "^Untitled";
        auto j = selector::encode(w);
        REQUIRE(j.size() == 1);
        REQUIRE(j["title_regex"] == "^Untitled");
    }

    SECTION("ParseText") {
        auto sel = selector::parse(R"({
            "window": {"title": "Calculator", "pid": 42},
            "targets": [{"name": "Seven", "control_type": "push button", "native_class": "GtkButton"}]
        })");
        REQUIRE(sel);
        REQUIRE(sel->window.pid == 42);
        REQUIRE(sel->targets[0].name == "Seven");
        REQUIRE(sel->targets[0].native_class == "GtkButton");
    }

    SECTION("MissingTargetsIsInvalid") {
        auto sel = selector::decode(json{{"window", {{"title", "x"}}}});
        REQUIRE_FALSE(sel);
        REQUIRE(sel.error().kind == ErrorKind::InvalidSelector);
    }

    SECTION("TargetWithoutKeysIsInvalid") {
        auto t = selector::decode_target(json{{"control_type", "push button"}});
        REQUIRE_FALSE(t);
        REQUIRE(t.error().kind == ErrorKind::InvalidSelector);
    }

    SECTION("NonStringStepAttributeIsInvalid") {
        auto t = selector::decode_target(json{{"path", json::array({{{"name", 5}}})}});
        REQUIRE_FALSE(t);
        REQUIRE(t.error().kind == ErrorKind::InvalidSelector);
    }

    SECTION("MalformedTextIsInvalid") {
        auto sel = selector::parse("{not json");
        REQUIRE_FALSE(sel);
        REQUIRE(sel.error().kind == ErrorKind::InvalidSelector);
    }
}
