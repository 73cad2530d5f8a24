// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drophint_export.h"
#include "interfaces.h"
#include "constants.h"
#include <QColor>
#include <QMarginsF>
#include <QPainterPath>
#include <QRectF>
#include <QSizeF>

class QAbstractAnimation;
class QPropertyAnimation;

namespace DropHint {

/**
 * @brief Animation state of a single drop zone
 *
 * Two channels are animated independently by Qt's animation framework:
 * - marginPercent: 0 (collapsed) to 1 (full container margin)
 * - backgroundColor: transparent to highlight
 *
 * Starting an animation on a channel always stops that channel's running
 * animation first and continues from its live value, so a reversal never
 * snaps. Neither property can be written from outside; both only move
 * through an animation.
 *
 * The zone does not draw. highlightRect()/highlightPath() describe the
 * clip for the current frame and highlightChanged() asks the host to repaint.
 */
class DROPHINT_EXPORT ZoneAnimator : public IDropZone
{
    Q_OBJECT

    Q_PROPERTY(bool showing READ isShowing NOTIFY showingChanged)
    Q_PROPERTY(qreal marginPercent READ marginPercent WRITE setMarginPercent NOTIFY marginPercentChanged)
    Q_PROPERTY(QColor backgroundColor READ backgroundColor WRITE setBackgroundColor NOTIFY backgroundColorChanged)
    Q_PROPERTY(bool highlightVisible READ isHighlightVisible NOTIFY highlightVisibleChanged)

public:
    explicit ZoneAnimator(QObject* parent = nullptr);
    explicit ZoneAnimator(const ThemeResources& theme, QObject* parent = nullptr);
    ~ZoneAnimator() override;

    // IDropZone
    bool isShowing() const override
    {
        return m_showing;
    }
    void setShowing(bool visible) override;
    void setContainerMargin(const QMarginsF& margins) override;
    void setBottomInset(qreal bottom) override;
    void onThemeChange(const ThemeResources& theme) override;

    /**
     * @brief Configure animation durations in milliseconds
     *
     * Values are clamped to [0, MaxAnimationDurationMs]. Running animations
     * keep their duration; the new values apply to the next start.
     */
    void setAnimationDurations(int enterMs, int exitMs, int backgroundMs);
    int marginEnterDuration() const
    {
        return m_enterDuration;
    }
    int marginExitDuration() const
    {
        return m_exitDuration;
    }
    int backgroundDuration() const
    {
        return m_backgroundDuration;
    }

    qreal marginPercent() const
    {
        return m_marginPercent;
    }
    QColor backgroundColor() const
    {
        return m_backgroundColor;
    }
    QColor highlightColor() const
    {
        return m_highlightColor;
    }
    qreal cornerRadius() const
    {
        return m_cornerRadius;
    }
    QMarginsF containerMargin() const
    {
        return m_containerMargin;
    }
    qreal bottomInset() const
    {
        return m_bottomInset;
    }
    bool isHighlightVisible() const
    {
        return m_highlightVisible;
    }

    /// Highlight clip rectangle for a zone of @p size at the live margin percent
    QRectF highlightRect(const QSizeF& size) const;

    /// Corner radius scaled by the live margin percent
    qreal currentCornerRadius() const
    {
        return m_cornerRadius * m_marginPercent;
    }

    /// Rounded-rectangle clip path (odd-even fill) for the current frame
    QPainterPath highlightPath(const QSizeF& size) const;

    QPropertyAnimation* marginAnimation() const
    {
        return m_marginAnimation;
    }
    QPropertyAnimation* backgroundAnimation() const
    {
        return m_backgroundAnimation;
    }

    /// @return the running margin animation, else the running background animation, else nullptr
    QAbstractAnimation* activeAnimation() const;

Q_SIGNALS:
    void marginPercentChanged(qreal percent);
    void backgroundColorChanged(const QColor& color);
    void highlightVisibleChanged(bool visible);

    /// Render state changed while the highlight occupies area; the host should repaint
    void highlightChanged();

private:
    void setMarginPercent(qreal percent);
    void setBackgroundColor(const QColor& color);
    void setHighlightVisible(bool visible);

    void animateMarginToState();
    void animateBackground(const QColor& target);
    void requestRepaint();

    QPropertyAnimation* m_marginAnimation = nullptr;
    QPropertyAnimation* m_backgroundAnimation = nullptr;

    bool m_showing = false;
    bool m_highlightVisible = false;
    qreal m_marginPercent = 0.0;
    QColor m_backgroundColor{Qt::transparent};
    QColor m_highlightColor;
    qreal m_cornerRadius = Defaults::CornerRadius;
    QMarginsF m_containerMargin;
    qreal m_bottomInset = 0.0;

    int m_enterDuration = Defaults::MarginEnterDurationMs;
    int m_exitDuration = Defaults::MarginExitDurationMs;
    int m_backgroundDuration = Defaults::BackgroundDurationMs;
};

} // namespace DropHint
