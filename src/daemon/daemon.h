// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <memory>

namespace DropHint {

class Settings;
class DisplayTracker;
class HintingOverlay;
class HintingAdaptor;

/**
 * @brief Main daemon for DropHint
 *
 * The daemon runs in the background and handles:
 * - Settings persistence (drophintrc)
 * - Primary screen and theme tracking
 * - Drop zone hinting driven by the drag controller over D-Bus
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class Daemon : public QObject
{
    Q_OBJECT

public:
    explicit Daemon(QObject* parent = nullptr);
    ~Daemon() override;

    // Initialization
    bool init();
    void start();
    void stop();

    // Component access
    Settings* settings() const
    {
        return m_settings.get();
    }
    HintingOverlay* overlay() const
    {
        return m_overlay.get();
    }

private:
    std::unique_ptr<Settings> m_settings;
    std::unique_ptr<DisplayTracker> m_displayTracker;
    std::unique_ptr<HintingOverlay> m_overlay;

    // D-Bus adaptor (owned by this QObject)
    HintingAdaptor* m_hintingAdaptor = nullptr;

    bool m_running = false;
    bool m_serviceRegistered = false;
};

} // namespace DropHint
