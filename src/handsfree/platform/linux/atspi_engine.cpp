#include "platform/linux/atspi_engine.hpp"

#include "platform/frame_choice.hpp"

#include <atspi/atspi.h>

#include <algorithm>
#include <cstring>
#include <format>
#include <print>

namespace {

using AccessiblePtr = std::shared_ptr<AtspiAccessible>;

AccessiblePtr adopt(AtspiAccessible* obj) {
    if (!obj) return nullptr;
    return AccessiblePtr(obj, [](AtspiAccessible* p) { g_object_unref(p); });
}

// Consumes the error.
std::string take_message(GError* err) {
    if (!err) return "unknown error";
    std::string msg = err->message ? err->message : "unknown error";
    g_error_free(err);
    return msg;
}

std::string take_string(gchar* s) {
    if (!s) return "";
    std::string out = s;
    g_free(s);
    return out;
}

std::string string_or_empty(gchar* s, GError* err) {
    if (err) g_error_free(err);
    return take_string(s);
}

std::expected<std::vector<AccessiblePtr>, Error> children_of(AtspiAccessible* obj) {
    GError* err = nullptr;
    gint count = atspi_accessible_get_child_count(obj, &err);
    if (err) return fail(ErrorKind::LookupFailed, "child count: " + take_message(err));

    std::vector<AccessiblePtr> out;
    out.reserve(static_cast<size_t>(std::max(count, 0)));
    for (gint i = 0; i < count; ++i) {
        AtspiAccessible* child = atspi_accessible_get_child_at_index(obj, i, &err);
        if (err) return fail(ErrorKind::LookupFailed, std::format("child {}: {}", i, take_message(err)));
        if (child) out.push_back(adopt(child));
    }
    return out;
}

std::expected<Rect, Error> extents_of(AtspiAccessible* obj) {
    AtspiComponent* comp = atspi_accessible_get_component_iface(obj);
    if (!comp) return fail(ErrorKind::LookupFailed, "no component interface");

    GError* err = nullptr;
    AtspiRect* r = atspi_component_get_extents(comp, ATSPI_COORD_TYPE_SCREEN, &err);
    g_object_unref(comp);
    if (err) return fail(ErrorKind::LookupFailed, "extents: " + take_message(err));
    if (!r) return fail(ErrorKind::LookupFailed, "extents unavailable");

    Rect out{.x = r->x, .y = r->y, .width = r->width, .height = r->height};
    g_free(r);
    return out;
}

int pid_of(AtspiAccessible* obj) {
    GError* err = nullptr;
    guint pid = atspi_accessible_get_process_id(obj, &err);
    if (err) {
        g_error_free(err);
        return 0;
    }
    return static_cast<int>(pid);
}

// GTK and Qt expose the widget class as "class", web engines the element as "tag".
std::string native_class_of(AtspiAccessible* obj) {
    GError* err = nullptr;
    GHashTable* attrs = atspi_accessible_get_attributes(obj, &err);
    if (err) g_error_free(err);
    if (!attrs) return "";

    std::string out;
    for (const char* key : {"class", "tag", "toolkit"}) {
        auto* val = static_cast<const char*>(g_hash_table_lookup(attrs, key));
        if (val && *val) {
            out = val;
            break;
        }
    }
    g_hash_table_unref(attrs);
    return out;
}

class AtspiControl : public Control {
public:
    explicit AtspiControl(AccessiblePtr obj) : obj_(std::move(obj)) {}

    AtspiAccessible* raw() const { return obj_.get(); }

    ControlAttributes attributes() const override {
        ControlAttributes a;
        GError* err = nullptr;
        a.control_type = string_or_empty(atspi_accessible_get_role_name(raw(), &err), err);
        err = nullptr;
        a.name = string_or_empty(atspi_accessible_get_name(raw(), &err), err);
        err = nullptr;
        a.stable_id = string_or_empty(atspi_accessible_get_accessible_id(raw(), &err), err);
        a.native_class = native_class_of(raw());
        return a;
    }

    std::expected<std::vector<ControlRef>, Error> children() const override {
        auto kids = children_of(raw());
        if (!kids) return std::unexpected(kids.error());

        std::vector<ControlRef> out;
        out.reserve(kids->size());
        for (auto& k : *kids) out.push_back(std::make_shared<AtspiControl>(std::move(k)));
        return out;
    }

    std::expected<ControlRef, Error> parent() const override {
        GError* err = nullptr;
        AtspiAccessible* p = atspi_accessible_get_parent(raw(), &err);
        if (err) return fail(ErrorKind::DetachedElement, "parent: " + take_message(err));
        if (!p) return ControlRef{};
        return std::make_shared<AtspiControl>(adopt(p));
    }

    std::expected<Rect, Error> rectangle() const override {
        return extents_of(raw());
    }

    std::expected<void, Error> click() override {
        AtspiAction* action = atspi_accessible_get_action_iface(raw());
        if (!action) return fail(ErrorKind::InjectionFailure, "control has no actions");

        GError* err = nullptr;
        gint n = atspi_action_get_n_actions(action, &err);
        if (err || n <= 0) {
            g_object_unref(action);
            return fail(ErrorKind::InjectionFailure, err ? take_message(err) : "control has no actions");
        }

        gint chosen = 0;
        for (gint i = 0; i < n; ++i) {
            auto name = string_or_empty(atspi_action_get_action_name(action, i, nullptr), nullptr);
            if (name == "click" || name == "press" || name == "activate" || name == "jump") {
                chosen = i;
                break;
            }
        }

        gboolean ok = atspi_action_do_action(action, chosen, &err);
        g_object_unref(action);
        if (err) return fail(ErrorKind::InjectionFailure, "action: " + take_message(err));
        if (!ok) return fail(ErrorKind::InjectionFailure, "action refused");
        return {};
    }

    std::expected<void, Error> set_text(const std::string& text) override {
        AtspiEditableText* editable = atspi_accessible_get_editable_text_iface(raw());
        if (!editable) return fail(ErrorKind::InjectionFailure, "control is not editable");

        GError* err = nullptr;
        gboolean ok = atspi_editable_text_set_text_contents(editable, text.c_str(), &err);
        g_object_unref(editable);
        if (err) return fail(ErrorKind::InjectionFailure, "set text: " + take_message(err));
        if (!ok) return fail(ErrorKind::InjectionFailure, "set text refused");
        return {};
    }

    bool same_as(const Control& other) const override {
        auto* o = dynamic_cast<const AtspiControl*>(&other);
        if (!o) return false;
        if (o->raw() == raw()) return true;

        // Same D-Bus object: bus name of the application plus object path.
        auto* a = ATSPI_OBJECT(raw());
        auto* b = ATSPI_OBJECT(o->raw());
        if (!a->path || !b->path || std::strcmp(a->path, b->path) != 0) return false;
        if (!a->app || !b->app) return false;
        return a->app->bus_name && b->app->bus_name && std::strcmp(a->app->bus_name, b->app->bus_name) == 0;
    }

private:
    AccessiblePtr obj_;
};

std::expected<AccessiblePtr, Error> desktop() {
    AtspiAccessible* d = atspi_get_desktop(0);
    if (!d) return fail(ErrorKind::LookupFailed, "accessibility bus unavailable");
    return adopt(d);
}

} // namespace

AtspiEngine::AtspiEngine() = default;

AtspiEngine::~AtspiEngine() {
    if (initialized_) atspi_exit();
}

bool AtspiEngine::init() {
    if (initialized_) return true;
    // atspi_init returns 1 when already initialized.
    int rc = atspi_init();
    if (rc != 0 && rc != 1) {
        std::println(stderr, "atspi: init failed ({})", rc);
        return false;
    }
    initialized_ = true;
    return true;
}

std::expected<ControlRef, Error> AtspiEngine::window_root(const WindowInfo& window) {
    auto root = desktop();
    if (!root) return std::unexpected(root.error());

    auto apps = children_of(root->get());
    if (!apps) return std::unexpected(apps.error());

    std::vector<AccessiblePtr> handles;
    std::vector<FrameCandidate> frames;
    for (const auto& app : *apps) {
        int pid = pid_of(app.get());
        if (window.pid > 0 && pid != window.pid) continue;

        auto app_frames = children_of(app.get());
        if (!app_frames) continue;
        for (const auto& frame : *app_frames) {
            GError* err = nullptr;
            frames.push_back({pid, string_or_empty(atspi_accessible_get_name(frame.get(), &err), err)});
            handles.push_back(frame);
        }
    }

    if (auto chosen = choose_frame(frames, window)) {
        return std::make_shared<AtspiControl>(handles[*chosen]);
    }
    return fail(ErrorKind::LookupFailed,
                std::format("no accessible frame for '{}' (pid {})", window.title, window.pid));
}

std::expected<PointHit, Error> AtspiEngine::control_at(int x, int y) {
    auto root = desktop();
    if (!root) return std::unexpected(root.error());

    auto apps = children_of(root->get());
    if (!apps) return std::unexpected(apps.error());

    for (const auto& app : *apps) {
        auto frames = children_of(app.get());
        if (!frames) continue;

        for (const auto& frame : *frames) {
            auto rect = extents_of(frame.get());
            if (!rect || !rect->contains(x, y)) continue;

            AtspiStateSet* states = atspi_accessible_get_state_set(frame.get());
            bool active = states && atspi_state_set_contains(states, ATSPI_STATE_ACTIVE);
            if (states) g_object_unref(states);
            if (!active) continue;

            // Descend through get_accessible_at_point until it stops yielding children.
            AccessiblePtr cur = frame;
            for (int depth = 0; depth < 256; ++depth) {
                AtspiComponent* comp = atspi_accessible_get_component_iface(cur.get());
                if (!comp) break;
                GError* err = nullptr;
                AtspiAccessible* next =
                    atspi_component_get_accessible_at_point(comp, x, y, ATSPI_COORD_TYPE_SCREEN, &err);
                g_object_unref(comp);
                if (err) {
                    g_error_free(err);
                    break;
                }
                if (!next || next == cur.get()) {
                    if (next) g_object_unref(next);
                    break;
                }
                cur = adopt(next);
            }

            return PointHit{
                .control = std::make_shared<AtspiControl>(cur),
                .window_root = std::make_shared<AtspiControl>(frame),
                .pid = pid_of(app.get()),
            };
        }
    }

    return fail(ErrorKind::LookupFailed, std::format("no active accessible window at ({}, {})", x, y));
}
