// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "displaytracker.h"
#include "logging.h"

#include <QEvent>
#include <QGuiApplication>
#include <QScreen>
#include <QStyleHints>

namespace DropHint {

DisplayTracker::DisplayTracker(QObject* parent)
    : QObject(parent)
{
    m_configuration = configurationFor(QGuiApplication::primaryScreen(), currentUiMode(), m_assetsSeq);
    m_insets = insetsFor(QGuiApplication::primaryScreen());
}

DisplayTracker::~DisplayTracker()
{
    stop();
}

void DisplayTracker::start()
{
    if (m_running || !qApp) {
        return;
    }
    m_running = true;

    connect(qApp, &QGuiApplication::primaryScreenChanged, this, &DisplayTracker::onPrimaryScreenChanged);
    connect(QGuiApplication::styleHints(), &QStyleHints::colorSchemeChanged, this, &DisplayTracker::refresh);
    qApp->installEventFilter(this);

    connectScreen(QGuiApplication::primaryScreen());
    refresh();
}

void DisplayTracker::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;

    disconnectScreen();
    if (qApp) {
        qApp->removeEventFilter(this);
        disconnect(qApp, &QGuiApplication::primaryScreenChanged, this, nullptr);
        disconnect(QGuiApplication::styleHints(), &QStyleHints::colorSchemeChanged, this, nullptr);
    }
}

DisplayConfiguration DisplayTracker::configurationFor(QScreen* screen, int uiMode, int assetsSeq)
{
    DisplayConfiguration config;
    config.uiMode = uiMode;
    config.assetsSeq = assetsSeq;
    if (!screen) {
        return config;
    }

    const QRect geometry = screen->geometry();
    config.displaySize = geometry.size();

    switch (screen->orientation()) {
    case Qt::PortraitOrientation:
    case Qt::InvertedPortraitOrientation:
        config.orientation = DisplayOrientation::Portrait;
        break;
    case Qt::LandscapeOrientation:
    case Qt::InvertedLandscapeOrientation:
        config.orientation = DisplayOrientation::Landscape;
        break;
    default:
        config.orientation =
            geometry.width() > geometry.height() ? DisplayOrientation::Landscape : DisplayOrientation::Portrait;
        break;
    }
    return config;
}

QMargins DisplayTracker::insetsFor(QScreen* screen)
{
    if (!screen) {
        return QMargins();
    }
    const QRect geometry = screen->geometry();
    const QRect available = screen->availableGeometry();
    if (!available.isValid() || !geometry.contains(available)) {
        return QMargins();
    }
    return QMargins(available.left() - geometry.left(), available.top() - geometry.top(),
                    geometry.right() - available.right(), geometry.bottom() - available.bottom());
}

bool DisplayTracker::eventFilter(QObject* watched, QEvent* event)
{
    if (watched == qApp && event->type() == QEvent::ApplicationPaletteChange) {
        ++m_assetsSeq;
        qCDebug(lcCore) << "Application palette changed, assets sequence" << m_assetsSeq;
        refresh();
    }
    return QObject::eventFilter(watched, event);
}

void DisplayTracker::onPrimaryScreenChanged(QScreen* screen)
{
    qCInfo(lcCore) << "Primary screen changed to" << (screen ? screen->name() : QStringLiteral("<none>"));
    disconnectScreen();
    connectScreen(screen);
    refresh();
}

void DisplayTracker::refresh()
{
    const DisplayConfiguration config = configurationFor(m_screen, currentUiMode(), m_assetsSeq);
    if (config != m_configuration) {
        m_configuration = config;
        qCDebug(lcCore) << "Display configuration size=" << config.displaySize
                          << "landscape=" << (config.orientation == DisplayOrientation::Landscape)
                          << "uiMode=" << config.uiMode;
        Q_EMIT configurationChanged(m_configuration);
    }

    const QMargins insets = insetsFor(m_screen);
    if (insets != m_insets) {
        m_insets = insets;
        Q_EMIT insetsChanged(m_insets);
    }
}

void DisplayTracker::connectScreen(QScreen* screen)
{
    m_screen = screen;
    if (!screen) {
        qCWarning(lcCore) << "No primary screen available";
        return;
    }
    m_screenConnections << connect(screen, &QScreen::geometryChanged, this, &DisplayTracker::refresh);
    m_screenConnections << connect(screen, &QScreen::availableGeometryChanged, this, &DisplayTracker::refresh);
    m_screenConnections << connect(screen, &QScreen::orientationChanged, this, &DisplayTracker::refresh);
}

void DisplayTracker::disconnectScreen()
{
    for (const auto& connection : std::as_const(m_screenConnections)) {
        disconnect(connection);
    }
    m_screenConnections.clear();
    m_screen.clear();
}

int DisplayTracker::currentUiMode() const
{
    if (!qApp) {
        return 0;
    }
    return static_cast<int>(QGuiApplication::styleHints()->colorScheme());
}

} // namespace DropHint
