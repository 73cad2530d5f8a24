// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hintingoverlay.h"
#include "constants.h"
#include "geometryutils.h"
#include "interfaces.h"
#include "logging.h"
#include "zoneanimator.h"

namespace DropHint {

namespace {
ThemeResources resolveTheme(ISettings* settings)
{
    if (settings) {
        return settings->themeResources();
    }
    QColor highlight = Defaults::HighlightColor;
    highlight.setAlphaF(Defaults::HighlightAlpha);
    return ThemeResources{highlight, static_cast<qreal>(Defaults::CornerRadius)};
}
} // anonymous namespace

HintingOverlay::HintingOverlay(const DisplayConfiguration& config, ISettings* settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_lastConfiguration(config)
    , m_classifier(QSizeF(config.displaySize))
    , m_layoutOrientation(GeometryUtils::layoutOrientation(config.orientation))
{
    if (!settings) {
        qCWarning(lcCore) << "HintingOverlay created without settings, using built-in defaults";
    }

    const ThemeResources theme = resolveTheme(m_settings);
    m_firstZone = std::make_unique<ZoneAnimator>(theme);
    m_secondZone = std::make_unique<ZoneAnimator>(theme);

    applyAnimationDurations();
    updateContainerMargins(config.orientation);
    updateBottomInsets(config.orientation);

    m_firstZone->setShowing(false);
    m_secondZone->setShowing(false);

    if (m_settings) {
        connect(m_settings, &ISettings::displayMarginChanged, this, [this]() {
            updateContainerMargins(m_lastConfiguration.orientation);
        });
        connect(m_settings, &ISettings::animationDurationsChanged, this, &HintingOverlay::applyAnimationDurations);
        connect(m_settings, &ISettings::useSystemColorsChanged, this, &HintingOverlay::applyTheme);
        connect(m_settings, &ISettings::highlightColorChanged, this, &HintingOverlay::applyTheme);
        connect(m_settings, &ISettings::highlightAlphaChanged, this, &HintingOverlay::applyTheme);
        connect(m_settings, &ISettings::cornerRadiusChanged, this, &HintingOverlay::applyTheme);
    }
}

// Out of line so the zones are destroyed while this object is still intact
HintingOverlay::~HintingOverlay() = default;

void HintingOverlay::show()
{
    if (!m_active) {
        m_active = true;
        Q_EMIT activeChanged(true);
    }
}

void HintingOverlay::hide()
{
    const bool wasActive = m_active;
    m_active = false;

    m_firstZone->setShowing(false);
    m_secondZone->setShowing(false);

    const HintResult previous = m_classifier.result();
    m_classifier.reset();

    if (wasActive) {
        Q_EMIT activeChanged(false);
    }
    if (previous != HintResult::None) {
        Q_EMIT hintingResultChanged(HintResult::None);
    }
}

HintResult HintingOverlay::update(const QRectF& dragRect)
{
    const HintResult previous = m_classifier.result();
    const HintResult result = m_classifier.update(dragRect, m_active);

    setZonesShowing(result);

    if (result != previous) {
        Q_EMIT hintingResultChanged(result);
    }
    return result;
}

void HintingOverlay::onConfigChanged(const DisplayConfiguration& config)
{
    qCDebug(lcCore) << "Configuration changed - size:" << config.displaySize
                    << "landscape:" << (config.orientation == DisplayOrientation::Landscape)
                    << "uiMode:" << config.uiMode << "assetsSeq:" << config.assetsSeq;

    const ConfigChanges changes = config.diff(m_lastConfiguration);

    const Qt::Orientation orientation = GeometryUtils::layoutOrientation(config.orientation);
    if (orientation != m_layoutOrientation) {
        m_layoutOrientation = orientation;
        qCInfo(lcCore) << "Config changed, setting" << (orientation == Qt::Horizontal ? "horizontal" : "vertical")
                       << "layout";
        updateContainerMargins(config.orientation);
        updateBottomInsets(config.orientation);
        Q_EMIT layoutOrientationChanged(orientation);
    }

    if (changes.testAnyFlags(ConfigChange::SizeChanged | ConfigChange::OrientationChanged)) {
        m_classifier.setDisplaySize(QSizeF(config.displaySize));
    }

    m_lastConfiguration = config;

    if (changes.testAnyFlags(ConfigChange::ThemeChanged)) {
        applyTheme();
    }
}

void HintingOverlay::applyInsets(const QMargins& insets)
{
    m_insets = insets;
    updateBottomInsets(m_lastConfiguration.orientation);
}

void HintingOverlay::setZonesShowing(HintResult result)
{
    // Clear the other zone first so both are never showing at the same time
    switch (result) {
    case HintResult::Left:
        m_secondZone->setShowing(false);
        m_firstZone->setShowing(true);
        break;
    case HintResult::Right:
        m_firstZone->setShowing(false);
        m_secondZone->setShowing(true);
        break;
    case HintResult::None:
        m_firstZone->setShowing(false);
        m_secondZone->setShowing(false);
        break;
    }
}

void HintingOverlay::updateContainerMargins(DisplayOrientation orientation)
{
    const ZoneMargins margins = GeometryUtils::containerMargins(orientation, displayMargin());
    m_firstZone->setContainerMargin(margins.first);
    m_secondZone->setContainerMargin(margins.second);
}

void HintingOverlay::updateBottomInsets(DisplayOrientation orientation)
{
    const auto [first, second] = GeometryUtils::bottomInsets(orientation, m_insets.bottom());
    m_firstZone->setBottomInset(first);
    m_secondZone->setBottomInset(second);
}

void HintingOverlay::applyAnimationDurations()
{
    if (!m_settings) {
        return;
    }
    for (ZoneAnimator* zone : {m_firstZone.get(), m_secondZone.get()}) {
        zone->setAnimationDurations(m_settings->marginEnterDuration(), m_settings->marginExitDuration(),
                                    m_settings->backgroundDuration());
    }
}

void HintingOverlay::applyTheme()
{
    const ThemeResources theme = resolveTheme(m_settings);
    m_firstZone->onThemeChange(theme);
    m_secondZone->onThemeChange(theme);
}

qreal HintingOverlay::displayMargin() const
{
    return m_settings ? m_settings->displayMargin() : Defaults::DisplayMargin;
}

} // namespace DropHint
