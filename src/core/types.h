// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drophint_export.h"
#include <QColor>
#include <QFlags>
#include <QMarginsF>
#include <QRectF>
#include <QSize>
#include <QString>

namespace DropHint {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Which drop zone the current drag would land in
 */
enum class HintResult {
    None = 0, ///< Outside both hit regions, or hinting inactive
    Left = 1, ///< Left (first) drop zone
    Right = 2 ///< Right (second) drop zone
};

/**
 * @brief Physical display orientation as reported by the host
 */
enum class DisplayOrientation {
    Portrait = 0, ///< Zones stacked vertically
    Landscape = 1 ///< Zones side by side
};

/**
 * @brief Parts of a DisplayConfiguration that differ from a previous one
 */
enum class ConfigChange {
    None = 0,
    SizeChanged = 1 << 0,
    OrientationChanged = 1 << 1,
    UiModeChanged = 1 << 2,   ///< Light/dark or other UI mode switch
    AssetsChanged = 1 << 3,   ///< Theme overlay or resource paths changed

    ThemeChanged = UiModeChanged | AssetsChanged
};
Q_DECLARE_FLAGS(ConfigChanges, ConfigChange)
Q_DECLARE_OPERATORS_FOR_FLAGS(ConfigChanges)

/**
 * @brief Snapshot of the display state relevant to hinting
 *
 * Supplied by the host on every configuration change. uiMode and assetsSeq
 * are opaque: only their change matters.
 */
struct DROPHINT_EXPORT DisplayConfiguration
{
    QSize displaySize;
    DisplayOrientation orientation = DisplayOrientation::Portrait;
    int uiMode = 0;
    int assetsSeq = 0;

    /// Flags for every field that differs from @p other
    ConfigChanges diff(const DisplayConfiguration& other) const;

    bool operator==(const DisplayConfiguration& other) const
    {
        return !diff(other);
    }
    bool operator!=(const DisplayConfiguration& other) const
    {
        return !(*this == other);
    }
};

/**
 * @brief Precomputed hit regions for the two drop zones
 *
 * Screen-relative, derived once per display configuration.
 */
struct DROPHINT_EXPORT ScreenBounds
{
    QRectF left;  ///< Hit region for the first (left) drop zone
    QRectF right; ///< Hit region for the second (right) drop zone
};

/**
 * @brief Container margins for both drop zones
 */
struct ZoneMargins
{
    QMarginsF first;
    QMarginsF second;
};

/**
 * @brief Theme-derived values a drop zone renders with
 */
struct ThemeResources
{
    QColor highlightColor; ///< Highlight fill, alpha already applied
    qreal cornerRadius = 0.0; ///< Window corner radius in pixels
};

DROPHINT_EXPORT QString hintResultToString(HintResult result);

} // namespace DropHint
