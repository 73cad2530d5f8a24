// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "regionclassifier.h"
#include "geometryutils.h"
#include "logging.h"

namespace DropHint {

RegionClassifier::RegionClassifier(const QSizeF& displaySize)
    : m_bounds(GeometryUtils::screenBounds(displaySize))
{
}

HintResult RegionClassifier::classify(const QPointF& center, const ScreenBounds& bounds, bool active)
{
    if (!active) {
        return HintResult::None;
    }
    // QRectF::contains() counts edges as inside and rejects null rects,
    // so an unconfigured display never matches.
    if (bounds.left.contains(center)) {
        return HintResult::Left;
    }
    if (bounds.right.contains(center)) {
        return HintResult::Right;
    }
    return HintResult::None;
}

void RegionClassifier::setDisplaySize(const QSizeF& displaySize)
{
    m_bounds = GeometryUtils::screenBounds(displaySize);
    qCDebug(lcHint) << "Hit regions for" << displaySize << "left:" << m_bounds.left << "right:" << m_bounds.right;
}

HintResult RegionClassifier::update(const QRectF& dragRect, bool active)
{
    const HintResult result = classify(dragRect.center(), m_bounds, active);
    if (result != m_result) {
        qCDebug(lcHint) << "Hint changed from" << hintResultToString(m_result) << "to"
                        << hintResultToString(result) << "at" << dragRect.center();
    }
    m_result = result;
    return result;
}

} // namespace DropHint
