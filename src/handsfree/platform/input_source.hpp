#pragma once

#include <functional>
#include <string>

enum class PointerButton { Left, Right, Middle };

struct PointerEvent {
    int x = 0;
    int y = 0;
    PointerButton button = PointerButton::Left;
    bool pressed = false;
};

enum class KeyKind {
    Printable,  // text holds the UTF-8 character
    Enter,
    Modifier,   // shift, ctrl, alt, super on their own
    Stop,       // the configured stop hotkey
    Other,      // any other non-printable key
};

struct KeyEvent {
    KeyKind kind = KeyKind::Other;
    std::string text;
};

// System-wide pointer button events, delivered on the source's own thread.
class PointerEventSource {
public:
    using Handler = std::function<void(const PointerEvent&)>;
    virtual ~PointerEventSource() = default;
    virtual bool start(Handler handler) = 0;
    virtual void stop() = 0;
};

// System-wide key press events, delivered on the source's own thread.
class KeyEventSource {
public:
    using Handler = std::function<void(const KeyEvent&)>;
    virtual ~KeyEventSource() = default;
    virtual bool start(Handler handler) = 0;
    virtual void stop() = 0;
};
