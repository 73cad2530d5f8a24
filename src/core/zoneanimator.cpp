// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "zoneanimator.h"
#include "geometryutils.h"
#include "logging.h"
#include <QEasingCurve>
#include <QPropertyAnimation>

namespace DropHint {

namespace {

QEasingCurve fastOutSlowIn()
{
    QEasingCurve curve(QEasingCurve::BezierSpline);
    curve.addCubicBezierSegment(Defaults::EasingControlPoint1, Defaults::EasingControlPoint2, QPointF(1.0, 1.0));
    return curve;
}

ThemeResources defaultTheme()
{
    QColor highlight = Defaults::HighlightColor;
    highlight.setAlphaF(Defaults::HighlightAlpha);
    return ThemeResources{highlight, static_cast<qreal>(Defaults::CornerRadius)};
}

int clampDuration(int ms)
{
    return qBound(0, ms, Defaults::MaxAnimationDurationMs);
}

// Interpolated colors are 8-bit per channel; compare at that precision
bool sameColor(const QColor& a, const QColor& b)
{
    return a.rgba() == b.rgba();
}

} // anonymous namespace

ZoneAnimator::ZoneAnimator(QObject* parent)
    : ZoneAnimator(defaultTheme(), parent)
{
}

ZoneAnimator::ZoneAnimator(const ThemeResources& theme, QObject* parent)
    : IDropZone(parent)
    , m_marginAnimation(new QPropertyAnimation(this, QByteArrayLiteral("marginPercent"), this))
    , m_backgroundAnimation(new QPropertyAnimation(this, QByteArrayLiteral("backgroundColor"), this))
    , m_highlightColor(theme.highlightColor)
    , m_cornerRadius(theme.cornerRadius)
{
    m_marginAnimation->setEasingCurve(fastOutSlowIn());
    m_backgroundAnimation->setEasingCurve(fastOutSlowIn());

    connect(m_marginAnimation, &QAbstractAnimation::finished, this, [this]() {
        setMarginPercent(m_marginAnimation->endValue().toReal());
    });
    connect(m_backgroundAnimation, &QAbstractAnimation::finished, this, [this]() {
        setBackgroundColor(m_backgroundAnimation->endValue().value<QColor>());
    });
}

ZoneAnimator::~ZoneAnimator()
{
    // Stop before the children are destroyed so no frame writes into a half-destroyed object
    m_marginAnimation->stop();
    m_backgroundAnimation->stop();
}

void ZoneAnimator::setShowing(bool visible)
{
    if (m_showing != visible) {
        m_showing = visible;
        animateMarginToState();
        if (m_showing) {
            animateBackground(m_highlightColor);
        }
        Q_EMIT showingChanged(m_showing);
    }

    // Re-evaluated on every call, so repeated hides stay cheap and safe
    if (!m_showing) {
        animateBackground(QColor(Qt::transparent));
        setHighlightVisible(false);
    } else {
        setHighlightVisible(true);
    }
}

void ZoneAnimator::setContainerMargin(const QMarginsF& margins)
{
    m_containerMargin = margins;
    requestRepaint();
}

void ZoneAnimator::setBottomInset(qreal bottom)
{
    m_bottomInset = bottom;
    requestRepaint();
}

void ZoneAnimator::onThemeChange(const ThemeResources& theme)
{
    m_cornerRadius = theme.cornerRadius;
    if (theme.highlightColor.isValid()) {
        m_highlightColor = theme.highlightColor;
    } else {
        qCWarning(lcZone) << "Ignoring invalid highlight color from theme";
    }

    if (m_showing) {
        animateBackground(m_highlightColor);
    }
    requestRepaint();
}

void ZoneAnimator::setAnimationDurations(int enterMs, int exitMs, int backgroundMs)
{
    m_enterDuration = clampDuration(enterMs);
    m_exitDuration = clampDuration(exitMs);
    m_backgroundDuration = clampDuration(backgroundMs);
}

QRectF ZoneAnimator::highlightRect(const QSizeF& size) const
{
    return GeometryUtils::highlightRect(size, m_containerMargin, m_marginPercent, m_bottomInset);
}

QPainterPath ZoneAnimator::highlightPath(const QSizeF& size) const
{
    QPainterPath path;
    path.setFillRule(Qt::OddEvenFill);
    const qreal radius = currentCornerRadius();
    path.addRoundedRect(highlightRect(size), radius, radius);
    return path;
}

QAbstractAnimation* ZoneAnimator::activeAnimation() const
{
    if (m_marginAnimation->state() == QAbstractAnimation::Running) {
        return m_marginAnimation;
    }
    if (m_backgroundAnimation->state() == QAbstractAnimation::Running) {
        return m_backgroundAnimation;
    }
    return nullptr;
}

void ZoneAnimator::setMarginPercent(qreal percent)
{
    percent = qBound(0.0, percent, 1.0);
    if (percent != m_marginPercent) {
        m_marginPercent = percent;
        Q_EMIT marginPercentChanged(m_marginPercent);
        Q_EMIT highlightChanged();
    }
}

void ZoneAnimator::setBackgroundColor(const QColor& color)
{
    if (m_backgroundColor != color) {
        m_backgroundColor = color;
        Q_EMIT backgroundColorChanged(m_backgroundColor);
    }
}

void ZoneAnimator::setHighlightVisible(bool visible)
{
    if (m_highlightVisible != visible) {
        m_highlightVisible = visible;
        Q_EMIT highlightVisibleChanged(m_highlightVisible);
    }
}

void ZoneAnimator::animateMarginToState()
{
    // stop() is synchronous: no frame of the old animation lands after this line
    m_marginAnimation->stop();

    const qreal target = m_showing ? 1.0 : 0.0;
    m_marginAnimation->setStartValue(m_marginPercent);
    m_marginAnimation->setEndValue(target);
    m_marginAnimation->setDuration(m_showing ? m_enterDuration : m_exitDuration);
    m_marginAnimation->start();

    qCDebug(lcZone) << "Margin animation from" << m_marginPercent << "to" << target << "over"
                    << m_marginAnimation->duration() << "ms";
}

void ZoneAnimator::animateBackground(const QColor& target)
{
    const bool running = m_backgroundAnimation->state() == QAbstractAnimation::Running;
    if (running && sameColor(m_backgroundAnimation->endValue().value<QColor>(), target)) {
        return;
    }
    if (!running && sameColor(m_backgroundColor, target)) {
        return;
    }

    m_backgroundAnimation->stop();
    m_backgroundAnimation->setStartValue(m_backgroundColor);
    m_backgroundAnimation->setEndValue(target);
    m_backgroundAnimation->setDuration(m_backgroundDuration);
    m_backgroundAnimation->start();

    qCDebug(lcZone) << "Background animation from" << m_backgroundColor << "to" << target;
}

void ZoneAnimator::requestRepaint()
{
    if (m_marginPercent > 0.0) {
        Q_EMIT highlightChanged();
    }
}

} // namespace DropHint
