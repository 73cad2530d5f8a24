// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drophint_export.h"
#include <QDBusAbstractAdaptor>
#include <QObject>
#include <QString>

namespace DropHint {

class HintingOverlay;

/**
 * @brief D-Bus adaptor for drag hinting
 *
 * Provides D-Bus interface: org.drophint.Hinting
 *
 * Lets an out-of-process drag controller (compositor effect, launcher)
 * drive the overlay:
 * - show()/hide() when a split-capable drag starts/ends
 * - update() for every drag position sample
 * - hintingResult() to read the current hint
 *
 * Results are reported as "left", "right" or "none".
 */
class DROPHINT_EXPORT HintingAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.drophint.Hinting")

public:
    explicit HintingAdaptor(HintingOverlay* overlay, QObject* parent);
    ~HintingAdaptor() override = default;

public Q_SLOTS:
    /**
     * Enable hinting for the current drag
     */
    void show();

    /**
     * Disable hinting and collapse both drop zones
     */
    void hide();

    /**
     * Called for every drag position sample
     * @param x Dragged object X position
     * @param y Dragged object Y position
     * @param width Dragged object width
     * @param height Dragged object height
     * @return Resulting hint ("left", "right" or "none")
     * @note Parameters are double because script callers send JS numbers as D-Bus doubles
     */
    QString update(double x, double y, double width, double height);

    /**
     * @return Current hint ("left", "right" or "none")
     */
    QString hintingResult() const;

Q_SIGNALS:
    /**
     * Emitted when the hint under the dragged object changes
     */
    void hintingResultChanged(const QString& result);

private:
    HintingOverlay* m_overlay;
};

} // namespace DropHint
