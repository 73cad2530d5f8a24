// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drophint_export.h"
#include "types.h"
#include <QMarginsF>
#include <QRectF>
#include <QSizeF>
#include <utility>

namespace DropHint {

/**
 * @brief Centralized geometry calculation utilities
 *
 * Pure functions shared by the overlay, the classifier and the zones.
 * None of them keep state.
 */
namespace GeometryUtils {

/**
 * @brief Compute the drop zone hit regions for a display
 * @param displaySize Display size in pixels
 * @return Left region (0, 0.1h, 0.4w, 0.9h) and right region (0.6w, 0.1h, w, 0.9h)
 *
 * A zero-sized display yields empty regions, which never match.
 */
DROPHINT_EXPORT ScreenBounds screenBounds(const QSizeF& displaySize);

/**
 * @brief Container margins for both zones so the gap between them equals one margin
 * @param orientation Display orientation
 * @param displayMargin Full margin in pixels
 *
 * Landscape halves zone 1's right and zone 2's left margin (side by side).
 * Portrait halves zone 1's bottom and zone 2's top margin (stacked).
 */
DROPHINT_EXPORT ZoneMargins containerMargins(DisplayOrientation orientation, qreal displayMargin);

/**
 * @brief Distribute the system bottom inset between the zones
 * @return {zone 1 inset, zone 2 inset}
 *
 * In portrait only the lower zone touches the bottom chrome.
 */
DROPHINT_EXPORT std::pair<qreal, qreal> bottomInsets(DisplayOrientation orientation, qreal bottomInset);

/// Landscape lays zones out horizontally, portrait vertically
DROPHINT_EXPORT Qt::Orientation layoutOrientation(DisplayOrientation orientation);

/**
 * @brief Highlight rectangle of a zone at a given animation position
 * @param size Zone size in pixels
 * @param margins Container margins at full show
 * @param percent Live margin percent in [0,1]
 * @param bottomInset Unscaled bottom inset
 */
DROPHINT_EXPORT QRectF highlightRect(const QSizeF& size, const QMarginsF& margins, qreal percent,
                                     qreal bottomInset);

} // namespace GeometryUtils

} // namespace DropHint
