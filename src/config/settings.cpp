// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include <KColorScheme>
#include <KConfig>
#include <KConfigGroup>
#include <KSharedConfig>
#include <QtNumeric>

namespace DropHint {

namespace {
inline const QString ConfigFileName = QStringLiteral("drophintrc");
inline const QString LayoutGroup = QStringLiteral("Layout");
inline const QString AnimationGroup = QStringLiteral("Animation");
inline const QString AppearanceGroup = QStringLiteral("Appearance");
} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped int setter: clamp value, then apply if changed
#define SETTINGS_SETTER_CLAMPED(name, member, signal, minVal, maxVal) \
    void Settings::set##name(int value) \
    { \
        value = qBound(minVal, value, maxVal); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

Settings::Settings(QObject* parent)
    : ISettings(parent)
{
    load();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

qreal Settings::readValidatedDouble(const KConfigGroup& group, const char* key, qreal defaultValue, qreal min,
                                    qreal max, const char* settingName)
{
    qreal value = group.readEntry(QLatin1String(key), defaultValue);
    if (!qIsFinite(value) || value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

QColor Settings::readValidatedColor(const KConfigGroup& group, const char* key, const QColor& defaultValue,
                                    const char* settingName)
{
    QColor color = group.readEntry(QLatin1String(key), defaultValue);
    if (!color.isValid()) {
        qCWarning(lcConfig) << "Invalid" << settingName << "color, using default";
        color = defaultValue;
    }
    return color;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Setters
// ═══════════════════════════════════════════════════════════════════════════════

SETTINGS_SETTER_CLAMPED(DisplayMargin, m_displayMargin, displayMarginChanged, 0, Defaults::MaxDisplayMargin)
SETTINGS_SETTER_CLAMPED(MarginEnterDuration, m_marginEnterDuration, animationDurationsChanged, 0,
                        Defaults::MaxAnimationDurationMs)
SETTINGS_SETTER_CLAMPED(MarginExitDuration, m_marginExitDuration, animationDurationsChanged, 0,
                        Defaults::MaxAnimationDurationMs)
SETTINGS_SETTER_CLAMPED(BackgroundDuration, m_backgroundDuration, animationDurationsChanged, 0,
                        Defaults::MaxAnimationDurationMs)
SETTINGS_SETTER(bool, UseSystemColors, m_useSystemColors, useSystemColorsChanged)
SETTINGS_SETTER_CLAMPED(CornerRadius, m_cornerRadius, cornerRadiusChanged, 0, Defaults::MaxCornerRadius)

void Settings::setHighlightColor(const QColor& color)
{
    if (!color.isValid()) {
        qCWarning(lcConfig) << "Rejecting invalid highlight color";
        return;
    }
    if (m_highlightColor != color) {
        m_highlightColor = color;
        Q_EMIT highlightColorChanged();
        Q_EMIT settingsChanged();
    }
}

void Settings::setHighlightAlpha(qreal alpha)
{
    if (!qIsFinite(alpha)) {
        qCWarning(lcConfig) << "Rejecting non-finite highlight alpha";
        return;
    }
    alpha = qBound(0.0, alpha, 1.0);
    if (!qFuzzyCompare(m_highlightAlpha, alpha)) {
        m_highlightAlpha = alpha;
        Q_EMIT highlightAlphaChanged();
        Q_EMIT settingsChanged();
    }
}

ThemeResources Settings::themeResources() const
{
    QColor highlight = m_highlightColor;
    if (m_useSystemColors) {
        KColorScheme scheme(QPalette::Active, KColorScheme::Selection);
        highlight = scheme.background(KColorScheme::ActiveBackground).color();
    }
    highlight.setAlphaF(m_highlightAlpha);
    return ThemeResources{highlight, static_cast<qreal>(m_cornerRadius)};
}

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::load()
{
    auto config = KSharedConfig::openConfig(ConfigFileName);

    // Force re-read from disk - KSharedConfig caches in memory
    config->reparseConfiguration();

    KConfigGroup layout = config->group(LayoutGroup);
    KConfigGroup animation = config->group(AnimationGroup);
    KConfigGroup appearance = config->group(AppearanceGroup);

    // Layout
    m_displayMargin = readValidatedInt(layout, "DisplayMargin", ConfigDefaults::displayMargin(), 0,
                                       Defaults::MaxDisplayMargin, "display margin");

    // Animation
    m_marginEnterDuration = readValidatedInt(animation, "MarginEnterDuration", ConfigDefaults::marginEnterDuration(),
                                             0, Defaults::MaxAnimationDurationMs, "margin enter duration");
    m_marginExitDuration = readValidatedInt(animation, "MarginExitDuration", ConfigDefaults::marginExitDuration(), 0,
                                            Defaults::MaxAnimationDurationMs, "margin exit duration");
    m_backgroundDuration = readValidatedInt(animation, "BackgroundDuration", ConfigDefaults::backgroundDuration(), 0,
                                            Defaults::MaxAnimationDurationMs, "background duration");

    // Appearance
    m_useSystemColors = appearance.readEntry(QLatin1String("UseSystemColors"), ConfigDefaults::useSystemColors());
    m_highlightColor =
        readValidatedColor(appearance, "HighlightColor", ConfigDefaults::highlightColor(), "highlight");
    m_highlightAlpha =
        readValidatedDouble(appearance, "HighlightAlpha", ConfigDefaults::highlightAlpha(), 0.0, 1.0, "highlight alpha");
    m_cornerRadius = readValidatedInt(appearance, "CornerRadius", ConfigDefaults::cornerRadius(), 0,
                                      Defaults::MaxCornerRadius, "corner radius");

    qCInfo(lcConfig) << "Settings loaded - margin:" << m_displayMargin << "enter:" << m_marginEnterDuration
                     << "exit:" << m_marginExitDuration << "system colors:" << m_useSystemColors;

    emitAllChanged();
}

void Settings::save()
{
    auto config = KSharedConfig::openConfig(ConfigFileName);
    KConfigGroup layout = config->group(LayoutGroup);
    KConfigGroup animation = config->group(AnimationGroup);
    KConfigGroup appearance = config->group(AppearanceGroup);

    // Layout
    layout.writeEntry(QLatin1String("DisplayMargin"), m_displayMargin);

    // Animation
    animation.writeEntry(QLatin1String("MarginEnterDuration"), m_marginEnterDuration);
    animation.writeEntry(QLatin1String("MarginExitDuration"), m_marginExitDuration);
    animation.writeEntry(QLatin1String("BackgroundDuration"), m_backgroundDuration);

    // Appearance
    appearance.writeEntry(QLatin1String("UseSystemColors"), m_useSystemColors);
    appearance.writeEntry(QLatin1String("HighlightColor"), m_highlightColor);
    appearance.writeEntry(QLatin1String("HighlightAlpha"), m_highlightAlpha);
    appearance.writeEntry(QLatin1String("CornerRadius"), m_cornerRadius);

    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write" << ConfigFileName;
    }
}

void Settings::reset()
{
    auto config = KSharedConfig::openConfig(ConfigFileName);
    config->deleteGroup(LayoutGroup);
    config->deleteGroup(AnimationGroup);
    config->deleteGroup(AppearanceGroup);
    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write" << ConfigFileName;
    }

    m_displayMargin = ConfigDefaults::displayMargin();
    m_marginEnterDuration = ConfigDefaults::marginEnterDuration();
    m_marginExitDuration = ConfigDefaults::marginExitDuration();
    m_backgroundDuration = ConfigDefaults::backgroundDuration();
    m_useSystemColors = ConfigDefaults::useSystemColors();
    m_highlightColor = ConfigDefaults::highlightColor();
    m_highlightAlpha = ConfigDefaults::highlightAlpha();
    m_cornerRadius = ConfigDefaults::cornerRadius();

    qCInfo(lcConfig) << "Settings reset to defaults";
    emitAllChanged();
}

void Settings::emitAllChanged()
{
    Q_EMIT displayMarginChanged();
    Q_EMIT animationDurationsChanged();
    Q_EMIT useSystemColorsChanged();
    Q_EMIT highlightColorChanged();
    Q_EMIT highlightAlphaChanged();
    Q_EMIT cornerRadiusChanged();
    Q_EMIT settingsChanged();
}

} // namespace DropHint
