// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drophint_export.h"
#include "regionclassifier.h"
#include "types.h"
#include <QMargins>
#include <QObject>
#include <QRectF>
#include <memory>

namespace DropHint {

class ISettings;
class ZoneAnimator;

/**
 * @brief Coordinates the visible drop zone hints for the current drag
 *
 * Owns the region classifier and both drop zones. Zone 1 is always the
 * left (landscape) or top (portrait) zone and answers to HintResult::Left.
 *
 * The drag controller calls show() when a drag that may split the screen
 * starts, update() for every position sample, and hide() when it ends.
 * The host forwards display configuration and system insets.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class DROPHINT_EXPORT HintingOverlay : public QObject
{
    Q_OBJECT

    Q_PROPERTY(bool active READ isActive NOTIFY activeChanged)
    Q_PROPERTY(Qt::Orientation layoutOrientation READ layoutOrientation NOTIFY layoutOrientationChanged)

public:
    /**
     * @param config Initial display configuration
     * @param settings Source of margins, durations and theme; may be null (defaults are used)
     */
    explicit HintingOverlay(const DisplayConfiguration& config, ISettings* settings, QObject* parent = nullptr);
    ~HintingOverlay() override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Drag controller surface
    // ═══════════════════════════════════════════════════════════════════════════

    /// Enable hinting; subsequent update() calls classify
    void show();

    /// Disable hinting, collapse both zones and reset the result to None
    void hide();

    /**
     * @brief Classify the dragged rectangle and drive both zones
     * @param dragRect Current bounds of the dragged object in screen coordinates
     * @return The new hint; None while hinting is inactive
     */
    HintResult update(const QRectF& dragRect);

    HintResult hintingResult() const
    {
        return m_classifier.result();
    }

    bool isActive() const
    {
        return m_active;
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Host notifications
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief React to a display configuration change
     *
     * Orientation switches the zone layout and its margins without restarting
     * animations. Size or orientation changes rebuild the hit regions. UI mode
     * or asset changes re-resolve the theme and pass it to both zones.
     */
    void onConfigChanged(const DisplayConfiguration& config);

    /**
     * @brief Apply system insets (tappable element and display cutout union)
     *
     * Only the bottom inset is consumed.
     */
    void applyInsets(const QMargins& insets);

    // ═══════════════════════════════════════════════════════════════════════════
    // State access
    // ═══════════════════════════════════════════════════════════════════════════

    ZoneAnimator* firstZone() const
    {
        return m_firstZone.get();
    }
    ZoneAnimator* secondZone() const
    {
        return m_secondZone.get();
    }
    const ScreenBounds& screenBounds() const
    {
        return m_classifier.bounds();
    }
    Qt::Orientation layoutOrientation() const
    {
        return m_layoutOrientation;
    }
    const DisplayConfiguration& configuration() const
    {
        return m_lastConfiguration;
    }
    QMargins insets() const
    {
        return m_insets;
    }

Q_SIGNALS:
    void hintingResultChanged(DropHint::HintResult result);
    void activeChanged(bool active);
    void layoutOrientationChanged(Qt::Orientation orientation);

private:
    void setZonesShowing(HintResult result);
    void updateContainerMargins(DisplayOrientation orientation);
    void updateBottomInsets(DisplayOrientation orientation);
    void applyAnimationDurations();
    void applyTheme();
    qreal displayMargin() const;

    ISettings* m_settings = nullptr;
    DisplayConfiguration m_lastConfiguration;
    RegionClassifier m_classifier;
    std::unique_ptr<ZoneAnimator> m_firstZone;
    std::unique_ptr<ZoneAnimator> m_secondZone;
    Qt::Orientation m_layoutOrientation = Qt::Vertical;
    QMargins m_insets;
    bool m_active = false;
};

} // namespace DropHint
