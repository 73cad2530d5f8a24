// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drophint_export.h"
#include <QList>
#include <QObject>

class QSocketNotifier;

namespace DropHint {

/**
 * @brief Delivers POSIX signals through the Qt event loop
 *
 * The signal handler only writes the signal number to a socket pair; the
 * read end is watched by a QSocketNotifier and unixSignal() is emitted from
 * the event loop, where any Qt or KConfig call is safe.
 *
 * Only one instance may exist at a time. A second instance is invalid and
 * watches nothing.
 */
class DROPHINT_EXPORT UnixSignalWatcher : public QObject
{
    Q_OBJECT

public:
    explicit UnixSignalWatcher(QObject* parent = nullptr);
    ~UnixSignalWatcher() override;

    bool isValid() const
    {
        return m_notifier != nullptr;
    }

    /**
     * @brief Route @p signum to unixSignal()
     * @return false if the watcher is invalid or the handler cannot be installed
     */
    bool watch(int signum);

Q_SIGNALS:
    void unixSignal(int signum);

private Q_SLOTS:
    void readSignal();

private:
    static void handleSignal(int signum);

    static int s_sockets[2];

    QSocketNotifier* m_notifier = nullptr;
    QList<int> m_watched;
};

} // namespace DropHint
