#pragma once

#include "error.hpp"
#include "geometry.hpp"
#include "sway/window_info.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

struct ControlAttributes {
    std::string control_type;  // accessibility role, e.g. "push button"
    std::string name;
    std::string stable_id;     // toolkit-assigned accessible id
    std::string native_class;  // toolkit class or tag
};

class Control;
using ControlRef = std::shared_ptr<Control>;

// A live node of the accessibility tree. References are only valid for the
// duration of one macro step; never cache them across steps.
class Control {
public:
    virtual ~Control() = default;

    virtual ControlAttributes attributes() const = 0;
    virtual std::expected<std::vector<ControlRef>, Error> children() const = 0;
    // Null reference when the node has no parent.
    virtual std::expected<ControlRef, Error> parent() const = 0;
    virtual std::expected<Rect, Error> rectangle() const = 0;

    // Accessibility action. Fails with InjectionFailure when the control
    // exposes no usable action.
    virtual std::expected<void, Error> click() = 0;
    // Fails with InjectionFailure when the control is not editable.
    virtual std::expected<void, Error> set_text(const std::string& text) = 0;

    // Identity: both references denote the same on-screen object.
    virtual bool same_as(const Control& other) const = 0;
};

struct PointHit {
    ControlRef control;
    ControlRef window_root;
    int pid = 0;
};

class AccessibilityEngine {
public:
    virtual ~AccessibilityEngine() = default;

    // Root of the accessibility subtree for a top-level window.
    virtual std::expected<ControlRef, Error> window_root(const WindowInfo& window) = 0;

    // Deepest control under a screen point, with the root of its window.
    virtual std::expected<PointHit, Error> control_at(int x, int y) = 0;
};
