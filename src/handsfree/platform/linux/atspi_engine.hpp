#pragma once

#include "platform/accessibility.hpp"

// Accessibility tree over AT-SPI2 (the accessibility bus). Applications must
// have accessibility enabled (GTK, Qt with QT_LINUX_ACCESSIBILITY_ALWAYS_ON,
// Chromium with --force-renderer-accessibility).
class AtspiEngine : public AccessibilityEngine {
public:
    AtspiEngine();
    ~AtspiEngine() override;

    AtspiEngine(const AtspiEngine&) = delete;
    AtspiEngine& operator=(const AtspiEngine&) = delete;

    bool init();

    std::expected<ControlRef, Error> window_root(const WindowInfo& window) override;
    std::expected<PointHit, Error> control_at(int x, int y) override;

private:
    bool initialized_ = false;
};
