// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drophint_export.h"
#include "types.h"
#include <QColor>

namespace DropHint {

/**
 * @brief Drop zone layout settings
 */
class DROPHINT_EXPORT IZoneLayoutSettings
{
public:
    virtual ~IZoneLayoutSettings() = default;

    /// Full container margin in pixels; the gap between zones uses half of it
    virtual int displayMargin() const = 0;
    virtual void setDisplayMargin(int margin) = 0;
};

/**
 * @brief Animation timing settings for drop zones
 *
 * Enter is expected to be longer than exit: hints appear deliberately
 * and dismiss quickly. This is a default, not a constraint.
 */
class DROPHINT_EXPORT IZoneAnimationSettings
{
public:
    virtual ~IZoneAnimationSettings() = default;

    virtual int marginEnterDuration() const = 0;
    virtual void setMarginEnterDuration(int ms) = 0;
    virtual int marginExitDuration() const = 0;
    virtual void setMarginExitDuration(int ms) = 0;
    virtual int backgroundDuration() const = 0;
    virtual void setBackgroundDuration(int ms) = 0;
};

/**
 * @brief Theme resolution for drop zone highlighting
 *
 * Consumers never read colors or radii from global state; they call
 * themeResources() when notified of a theme change and pass the
 * result on explicitly.
 */
class DROPHINT_EXPORT IThemeSettings
{
public:
    virtual ~IThemeSettings() = default;

    virtual bool useSystemColors() const = 0;
    virtual void setUseSystemColors(bool use) = 0;
    virtual QColor highlightColor() const = 0;
    virtual void setHighlightColor(const QColor& color) = 0;
    virtual qreal highlightAlpha() const = 0;
    virtual void setHighlightAlpha(qreal alpha) = 0;
    virtual int cornerRadius() const = 0;
    virtual void setCornerRadius(int radius) = 0;

    /// Resolved highlight color (alpha applied) and corner radius
    virtual ThemeResources themeResources() const = 0;
};

} // namespace DropHint
