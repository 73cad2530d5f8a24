// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include "../core/constants.h"
#include <KConfigGroup>

namespace DropHint {

/**
 * @brief Global settings for DropHint
 *
 * Implements the ISettings interface with KConfig integration
 * (drophintrc). Values outside their valid range are logged and
 * replaced by the .kcfg defaults on load; setters clamp.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class DROPHINT_EXPORT Settings : public ISettings
{
    Q_OBJECT

    // Layout
    Q_PROPERTY(int displayMargin READ displayMargin WRITE setDisplayMargin NOTIFY displayMarginChanged)

    // Animation
    Q_PROPERTY(int marginEnterDuration READ marginEnterDuration WRITE setMarginEnterDuration NOTIFY
                   animationDurationsChanged)
    Q_PROPERTY(int marginExitDuration READ marginExitDuration WRITE setMarginExitDuration NOTIFY
                   animationDurationsChanged)
    Q_PROPERTY(int backgroundDuration READ backgroundDuration WRITE setBackgroundDuration NOTIFY
                   animationDurationsChanged)

    // Appearance
    Q_PROPERTY(bool useSystemColors READ useSystemColors WRITE setUseSystemColors NOTIFY useSystemColorsChanged)
    Q_PROPERTY(QColor highlightColor READ highlightColor WRITE setHighlightColor NOTIFY highlightColorChanged)
    Q_PROPERTY(qreal highlightAlpha READ highlightAlpha WRITE setHighlightAlpha NOTIFY highlightAlphaChanged)
    Q_PROPERTY(int cornerRadius READ cornerRadius WRITE setCornerRadius NOTIFY cornerRadiusChanged)

public:
    explicit Settings(QObject* parent = nullptr);
    ~Settings() override = default;

    // IZoneLayoutSettings
    int displayMargin() const override
    {
        return m_displayMargin;
    }
    void setDisplayMargin(int margin) override;

    // IZoneAnimationSettings
    int marginEnterDuration() const override
    {
        return m_marginEnterDuration;
    }
    void setMarginEnterDuration(int ms) override;
    int marginExitDuration() const override
    {
        return m_marginExitDuration;
    }
    void setMarginExitDuration(int ms) override;
    int backgroundDuration() const override
    {
        return m_backgroundDuration;
    }
    void setBackgroundDuration(int ms) override;

    // IThemeSettings
    bool useSystemColors() const override
    {
        return m_useSystemColors;
    }
    void setUseSystemColors(bool use) override;
    QColor highlightColor() const override
    {
        return m_highlightColor;
    }
    void setHighlightColor(const QColor& color) override;
    qreal highlightAlpha() const override
    {
        return m_highlightAlpha;
    }
    void setHighlightAlpha(qreal alpha) override;
    int cornerRadius() const override
    {
        return m_cornerRadius;
    }
    void setCornerRadius(int radius) override;

    ThemeResources themeResources() const override;

    // Persistence
    void load() override;
    void save() override;
    void reset() override;

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);
    static qreal readValidatedDouble(const KConfigGroup& group, const char* key, qreal defaultValue, qreal min,
                                     qreal max, const char* settingName);
    static QColor readValidatedColor(const KConfigGroup& group, const char* key, const QColor& defaultValue,
                                     const char* settingName);

    void emitAllChanged();

    // Layout
    int m_displayMargin = Defaults::DisplayMargin;

    // Animation
    int m_marginEnterDuration = Defaults::MarginEnterDurationMs;
    int m_marginExitDuration = Defaults::MarginExitDurationMs;
    int m_backgroundDuration = Defaults::BackgroundDurationMs;

    // Appearance
    bool m_useSystemColors = true;
    QColor m_highlightColor = Defaults::HighlightColor;
    qreal m_highlightAlpha = Defaults::HighlightAlpha;
    int m_cornerRadius = Defaults::CornerRadius;
};

} // namespace DropHint
