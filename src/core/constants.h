// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QColor>
#include <QLatin1String>
#include <QPointF>
#include <QString>

namespace DropHint {

/**
 * @brief Default values for drop zone appearance and core module constants
 *
 * These defaults are used by core module files that can't depend on config.
 * For user-configurable settings, see ConfigDefaults and drophint.kcfg.
 *
 * The hit-region fractions are structural and are NOT in .kcfg.
 */
namespace Defaults {
// Hit regions: vertical inset from top and bottom, horizontal extent from each side
constexpr qreal HitVerticalMarginFraction = 0.1;
constexpr qreal HitHorizontalMarginFraction = 0.4;

// Animation durations (milliseconds)
constexpr int MarginEnterDurationMs = 400;
constexpr int MarginExitDurationMs = 250;
constexpr int BackgroundDurationMs = 300;
constexpr int MaxAnimationDurationMs = 5000;

// Fast-out-slow-in cubic bezier control points
inline constexpr QPointF EasingControlPoint1{0.4, 0.0};
inline constexpr QPointF EasingControlPoint2{0.2, 1.0};

// Appearance
constexpr qreal HighlightAlpha = 0.9;
inline const QColor HighlightColor{0, 120, 212};
constexpr int CornerRadius = 16;
constexpr int DisplayMargin = 16;
constexpr int MaxDisplayMargin = 500;
constexpr int MaxCornerRadius = 200;
}

/**
 * @brief D-Bus service constants
 *
 * Centralized D-Bus names to avoid magic strings in the daemon and adaptor.
 */
namespace DBus {
inline const QString ServiceName = QStringLiteral("org.drophint");
inline const QString ObjectPath = QStringLiteral("/DropHint");

namespace Interface {
inline const QString Hinting = QStringLiteral("org.drophint.Hinting");
}
}

/**
 * @brief Wire names for hint results on D-Bus and in logs
 */
namespace HintNames {
inline constexpr QLatin1String Left{"left"};
inline constexpr QLatin1String Right{"right"};
inline constexpr QLatin1String None{"none"};
}

} // namespace DropHint
