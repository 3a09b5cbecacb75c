#include "selector/selector.hpp"

#include <format>

using json = nlohmann::json;

TargetCandidate TargetCandidate::by_stable_id(std::string stable_id, std::string control_type) {
    TargetCandidate t;
    t.kind = Kind::StableId;
    t.stable_id = std::move(stable_id);
    t.control_type = std::move(control_type);
    return t;
}

TargetCandidate TargetCandidate::by_name(std::string name, std::string control_type) {
    TargetCandidate t;
    t.kind = Kind::Name;
    t.name = std::move(name);
    t.control_type = std::move(control_type);
    return t;
}

TargetCandidate TargetCandidate::by_path(std::vector<SelectorStep> path) {
    TargetCandidate t;
    t.kind = Kind::Path;
    t.path = std::move(path);
    return t;
}

std::string TargetCandidate::summary() const {
    switch (kind) {
        case Kind::StableId:
            return std::format("stable_id={} ({})", stable_id, control_type);
        case Kind::Name:
            return std::format("name='{}' ({})", name, control_type);
        case Kind::Path:
            return std::format("path[{}]", path.size());
    }
    return {};
}

namespace selector {

namespace {

// Reads an optional string field; non-string values are a schema error.
bool read_optional(const json& j, const char* key, std::optional<std::string>& out) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_string()) return false;
    out = j[key].get<std::string>();
    return true;
}

std::expected<SelectorStep, Error> decode_step(const json& j, size_t index) {
    if (!j.is_object()) {
        return fail(ErrorKind::InvalidSelector, std::format("path step {} is not an object", index));
    }

    SelectorStep step;
    if (!read_optional(j, "control_type", step.control_type) ||
        !read_optional(j, "name", step.name) ||
        !read_optional(j, "stable_id", step.stable_id) ||
        !read_optional(j, "native_class", step.native_class)) {
        return fail(ErrorKind::InvalidSelector, std::format("path step {} has a non-string attribute", index));
    }

    if (j.contains("sibling_index") && !j["sibling_index"].is_null()) {
        if (!j["sibling_index"].is_number_integer()) {
            return fail(ErrorKind::InvalidSelector,
                        std::format("path step {} sibling_index is not an integer", index));
        }
        step.sibling_index = j["sibling_index"].get<int>();
    }
    return step;
}

} // namespace

json encode(const WindowDescriptor& window) {
    json j = json::object();
    if (window.handle) j["handle"] = *window.handle;
    if (!window.title.empty()) j["title"] = window.title;
    if (!window.title_regex.empty()) j["title_regex"] = window.title_regex;
    if (window.pid > 0) j["pid"] = window.pid;
    return j;
}

json encode(const SelectorStep& step) {
    json j = json::object();
    if (step.control_type) j["control_type"] = *step.control_type;
    if (step.name) j["name"] = *step.name;
    if (step.stable_id) j["stable_id"] = *step.stable_id;
    if (step.native_class) j["native_class"] = *step.native_class;
    if (step.sibling_index) j["sibling_index"] = *step.sibling_index;
    return j;
}

json encode(const TargetCandidate& target) {
    json j = json::object();
    switch (target.kind) {
        case TargetCandidate::Kind::StableId:
            j["stable_id"] = target.stable_id;
            j["control_type"] = target.control_type;
            break;
        case TargetCandidate::Kind::Name:
            j["name"] = target.name;
            j["control_type"] = target.control_type;
            break;
        case TargetCandidate::Kind::Path: {
            json path = json::array();
            for (const auto& step : target.path) path.push_back(encode(step));
            j["path"] = std::move(path);
            break;
        }
    }
    if (!target.native_class.empty()) j["native_class"] = target.native_class;
    return j;
}

json encode(const Selector& sel) {
    json targets = json::array();
    for (const auto& t : sel.targets) targets.push_back(encode(t));
    return {{"window", encode(sel.window)}, {"targets", std::move(targets)}};
}

std::expected<WindowDescriptor, Error> decode_window(const json& j) {
    if (!j.is_object()) {
        return fail(ErrorKind::InvalidSelector, "window must be an object");
    }

    try {
        WindowDescriptor w;
        if (j.contains("handle") && !j["handle"].is_null()) w.handle = j["handle"].get<int64_t>();
        w.title = j.value("title", "");
        w.title_regex = j.value("title_regex", "");
        w.pid = j.value("pid", 0);
        return w;
    } catch (const json::exception& e) {
        return fail(ErrorKind::InvalidSelector, std::string("window: ") + e.what());
    }
}

std::expected<TargetCandidate, Error> decode_target(const json& j) {
    if (!j.is_object()) {
        return fail(ErrorKind::InvalidSelector, "target must be an object");
    }

    try {
        TargetCandidate t;
        t.native_class = j.value("native_class", "");

        if (j.contains("path")) {
            if (!j["path"].is_array()) {
                return fail(ErrorKind::InvalidSelector, "target path must be an array");
            }
            t.kind = TargetCandidate::Kind::Path;
            size_t i = 0;
            for (const auto& s : j["path"]) {
                auto step = decode_step(s, i++);
                if (!step) return std::unexpected(step.error());
                t.path.push_back(std::move(*step));
            }
            return t;
        }

        t.control_type = j.value("control_type", "");
        if (j.contains("stable_id")) {
            t.kind = TargetCandidate::Kind::StableId;
            t.stable_id = j["stable_id"].get<std::string>();
            if (t.stable_id.empty()) return fail(ErrorKind::InvalidSelector, "empty stable_id target");
            return t;
        }
        if (j.contains("name")) {
            t.kind = TargetCandidate::Kind::Name;
            t.name = j["name"].get<std::string>();
            if (t.name.empty()) return fail(ErrorKind::InvalidSelector, "empty name target");
            return t;
        }
    } catch (const json::exception& e) {
        return fail(ErrorKind::InvalidSelector, std::string("target: ") + e.what());
    }

    return fail(ErrorKind::InvalidSelector, "target needs one of stable_id, name, path");
}

std::expected<Selector, Error> decode(const json& j) {
    if (!j.is_object()) {
        return fail(ErrorKind::InvalidSelector, "selector must be an object");
    }

    Selector sel;
    if (j.contains("window")) {
        auto window = decode_window(j["window"]);
        if (!window) return std::unexpected(window.error());
        sel.window = std::move(*window);
    }

    if (!j.contains("targets") || !j["targets"].is_array()) {
        return fail(ErrorKind::InvalidSelector, "selector needs a targets array");
    }
    for (const auto& t : j["targets"]) {
        auto target = decode_target(t);
        if (!target) return std::unexpected(target.error());
        sel.targets.push_back(std::move(*target));
    }
    return sel;
}

std::expected<Selector, Error> parse(const std::string& text) {
    try {
        return decode(json::parse(text));
    } catch (const json::parse_error& e) {
        return fail(ErrorKind::InvalidSelector, std::string("JSON parse error: ") + e.what());
    }
}

} // namespace selector
