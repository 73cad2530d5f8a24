// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drophintconfig.h" // Generated from drophint.kcfg via KConfigXT

#include <QColor>

namespace DropHint {

/**
 * @brief Provides static access to default configuration values
 *
 * Wraps the KConfigXT-generated DropHintConfig class. The .kcfg file is the
 * single source of truth for user-configurable defaults; this class only
 * exposes the generated values.
 *
 * Usage:
 *   int margin = ConfigDefaults::displayMargin();  // Returns 16 (from .kcfg)
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Layout Settings
    // ═══════════════════════════════════════════════════════════════════════════

    static int displayMargin() { return instance().defaultDisplayMarginValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Animation Settings
    // ═══════════════════════════════════════════════════════════════════════════

    static int marginEnterDuration() { return instance().defaultMarginEnterDurationValue(); }
    static int marginExitDuration() { return instance().defaultMarginExitDurationValue(); }
    static int backgroundDuration() { return instance().defaultBackgroundDurationValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Appearance Settings
    // ═══════════════════════════════════════════════════════════════════════════

    static bool useSystemColors() { return instance().defaultUseSystemColorsValue(); }
    static QColor highlightColor() { return instance().defaultHighlightColorValue(); }
    static double highlightAlpha() { return instance().defaultHighlightAlphaValue(); }
    static int cornerRadius() { return instance().defaultCornerRadiusValue(); }

private:
    // Lazily-initialized instance
    static DropHintConfig& instance()
    {
        static DropHintConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace DropHint
