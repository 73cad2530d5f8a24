// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drophint_export.h"
#include "types.h"
#include <QPointF>
#include <QRectF>
#include <QSizeF>

namespace DropHint {

/**
 * @brief Maps a drag position to the drop zone it would land in
 *
 * The classification itself is a pure function (classify()). An instance
 * additionally owns the ScreenBounds for the current display and the last
 * result, so consumers can read the current hint without re-classifying.
 *
 * Containment is inclusive: points on a region's edge count as inside.
 * The left region is tested first, so a point inside both resolves to Left.
 */
class DROPHINT_EXPORT RegionClassifier
{
public:
    RegionClassifier() = default;
    explicit RegionClassifier(const QSizeF& displaySize);

    /**
     * @brief Classify a point against hit regions
     * @param center Drag center in screen coordinates
     * @param bounds Hit regions
     * @param active False short-circuits to None regardless of geometry
     */
    static HintResult classify(const QPointF& center, const ScreenBounds& bounds, bool active);

    /// Rebuild the hit regions for a new display size
    void setDisplaySize(const QSizeF& displaySize);

    const ScreenBounds& bounds() const
    {
        return m_bounds;
    }

    /**
     * @brief Classify the center of a drag rectangle and remember the result
     *
     * Degenerate (zero-area) rectangles are accepted; only the center is used.
     */
    HintResult update(const QRectF& dragRect, bool active);

    HintResult result() const
    {
        return m_result;
    }

    /// Forget the last result (used when hinting is deactivated)
    void reset()
    {
        m_result = HintResult::None;
    }

private:
    ScreenBounds m_bounds;
    HintResult m_result = HintResult::None;
};

} // namespace DropHint
