// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"

#include <QDBusConnection>
#include <QDBusError>

#include "../core/constants.h"
#include "../core/displaytracker.h"
#include "../core/hintingoverlay.h"
#include "../core/logging.h"
#include "../config/settings.h"
#include "../dbus/hintingadaptor.h"

namespace DropHint {

Daemon::Daemon(QObject* parent)
    : QObject(parent)
    , m_settings(std::make_unique<Settings>())
    , m_displayTracker(std::make_unique<DisplayTracker>())
{
}

Daemon::~Daemon()
{
    stop();
}

bool Daemon::init()
{
    // Overlay starts from whatever the primary screen reports right now
    m_overlay = std::make_unique<HintingOverlay>(m_displayTracker->configuration(), m_settings.get());
    m_overlay->applyInsets(m_displayTracker->insets());

    connect(m_displayTracker.get(), &DisplayTracker::configurationChanged, m_overlay.get(),
            &HintingOverlay::onConfigChanged);
    connect(m_displayTracker.get(), &DisplayTracker::insetsChanged, m_overlay.get(), &HintingOverlay::applyInsets);

    // Create D-Bus adaptor
    m_hintingAdaptor = new HintingAdaptor(m_overlay.get(), this);

    // Register D-Bus service and object
    auto bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qCCritical(lcDaemon) << "Cannot connect to session D-Bus - daemon cannot function without D-Bus";
        return false;
    }

    if (!bus.registerService(QString(DBus::ServiceName))) {
        const QDBusError error = bus.lastError();
        qCCritical(lcDaemon) << "Failed to register D-Bus service:" << DBus::ServiceName << "Error:" << error.message()
                             << "Type:" << error.type();
        return false;
    }
    m_serviceRegistered = true;

    if (!bus.registerObject(QString(DBus::ObjectPath), this)) {
        const QDBusError error = bus.lastError();
        qCCritical(lcDaemon) << "Failed to register D-Bus object:" << DBus::ObjectPath << "Error:" << error.message();
        // Cleanup: unregister service if object registration fails
        bus.unregisterService(QString(DBus::ServiceName));
        m_serviceRegistered = false;
        return false;
    }

    qCInfo(lcDaemon) << "D-Bus service registered service= " << DBus::ServiceName << " path= " << DBus::ObjectPath
                     << " interface= " << DBus::Interface::Hinting;
    return true;
}

void Daemon::start()
{
    if (m_running || !m_overlay) {
        return;
    }

    m_displayTracker->start();
    m_running = true;
}

void Daemon::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;

    m_displayTracker->stop();
    m_overlay->hide();

    // Save state
    m_settings->save();

    if (m_serviceRegistered) {
        auto bus = QDBusConnection::sessionBus();
        bus.unregisterObject(QString(DBus::ObjectPath));
        bus.unregisterService(QString(DBus::ServiceName));
        m_serviceRegistered = false;
    }

    qCInfo(lcDaemon) << "Daemon stopped";
}

} // namespace DropHint
