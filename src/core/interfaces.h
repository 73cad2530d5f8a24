// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drophint_export.h"
#include "settings_interfaces.h"
#include "types.h"
#include <QMarginsF>
#include <QObject>

namespace DropHint {

/**
 * @brief Abstract interface for settings management
 *
 * Allows dependency inversion - the overlay depends on this interface
 * rather than the concrete KConfig-backed Settings.
 */
class DROPHINT_EXPORT ISettings : public QObject,
                                  public IZoneLayoutSettings,
                                  public IZoneAnimationSettings,
                                  public IThemeSettings
{
    Q_OBJECT

public:
    explicit ISettings(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~ISettings() override;

    // Persistence (unique to ISettings)
    virtual void load() = 0;
    virtual void save() = 0;
    virtual void reset() = 0;

Q_SIGNALS:
    void settingsChanged();
    void displayMarginChanged();
    void animationDurationsChanged();
    void useSystemColorsChanged();
    void highlightColorChanged();
    void highlightAlphaChanged();
    void cornerRadiusChanged();
};

/**
 * @brief Capability interface of a single drop zone
 *
 * The overlay owns two of these and drives them; it never touches
 * their render state directly.
 */
class DROPHINT_EXPORT IDropZone : public QObject
{
    Q_OBJECT

public:
    explicit IDropZone(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~IDropZone() override;

    virtual bool isShowing() const = 0;

    /**
     * @brief Show or hide the zone hint
     *
     * Safe to call repeatedly with the same value.
     */
    virtual void setShowing(bool visible) = 0;

    /// Margins around the zone when fully showing
    virtual void setContainerMargin(const QMarginsF& margins) = 0;

    /// Unscaled inset keeping the zone above bottom system chrome
    virtual void setBottomInset(qreal bottom) = 0;

    virtual void onThemeChange(const ThemeResources& theme) = 0;

Q_SIGNALS:
    void showingChanged(bool showing);
};

} // namespace DropHint
