// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geometryutils.h"
#include "constants.h"

namespace DropHint {

namespace GeometryUtils {

ScreenBounds screenBounds(const QSizeF& displaySize)
{
    const qreal width = displaySize.width();
    const qreal height = displaySize.height();
    const qreal verticalMargin = height * Defaults::HitVerticalMarginFraction;
    const qreal horizontalMargin = width * Defaults::HitHorizontalMarginFraction;

    ScreenBounds bounds;
    bounds.left = QRectF(QPointF(0.0, verticalMargin), QPointF(horizontalMargin, height - verticalMargin));
    bounds.right =
        QRectF(QPointF(width - horizontalMargin, verticalMargin), QPointF(width, height - verticalMargin));
    return bounds;
}

ZoneMargins containerMargins(DisplayOrientation orientation, qreal displayMargin)
{
    const qreal m = displayMargin;
    const qreal half = displayMargin / 2.0;

    ZoneMargins margins;
    if (orientation == DisplayOrientation::Landscape) {
        margins.first = QMarginsF(m, m, half, m);
        margins.second = QMarginsF(half, m, m, m);
    } else {
        margins.first = QMarginsF(m, m, m, half);
        margins.second = QMarginsF(m, half, m, m);
    }
    return margins;
}

std::pair<qreal, qreal> bottomInsets(DisplayOrientation orientation, qreal bottomInset)
{
    if (orientation == DisplayOrientation::Landscape) {
        return {bottomInset, bottomInset};
    }
    return {0.0, bottomInset};
}

Qt::Orientation layoutOrientation(DisplayOrientation orientation)
{
    return orientation == DisplayOrientation::Landscape ? Qt::Horizontal : Qt::Vertical;
}

QRectF highlightRect(const QSizeF& size, const QMarginsF& margins, qreal percent, qreal bottomInset)
{
    const QPointF topLeft(margins.left() * percent, margins.top() * percent);
    const QPointF bottomRight(size.width() - margins.right() * percent,
                              size.height() - margins.bottom() * percent - bottomInset);
    return QRectF(topLeft, bottomRight);
}

} // namespace GeometryUtils

} // namespace DropHint
