// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "unixsignalwatcher.h"
#include "logging.h"

#include <QSocketNotifier>

#include <cerrno>
#include <cstring>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

namespace DropHint {

int UnixSignalWatcher::s_sockets[2] = {-1, -1};

UnixSignalWatcher::UnixSignalWatcher(QObject* parent)
    : QObject(parent)
{
    if (s_sockets[0] != -1) {
        qCWarning(lcCore) << "UnixSignalWatcher already exists, signals will not be delivered to this instance";
        return;
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, s_sockets) != 0) {
        qCWarning(lcCore) << "Cannot create signal socket pair:" << std::strerror(errno);
        s_sockets[0] = s_sockets[1] = -1;
        return;
    }

    m_notifier = new QSocketNotifier(s_sockets[1], QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &UnixSignalWatcher::readSignal);
}

UnixSignalWatcher::~UnixSignalWatcher()
{
    if (!m_notifier) {
        return;
    }

    for (int signum : std::as_const(m_watched)) {
        ::signal(signum, SIG_DFL);
    }

    m_notifier->setEnabled(false);
    ::close(s_sockets[0]);
    ::close(s_sockets[1]);
    s_sockets[0] = s_sockets[1] = -1;
}

bool UnixSignalWatcher::watch(int signum)
{
    if (!m_notifier) {
        return false;
    }
    if (m_watched.contains(signum)) {
        return true;
    }

    struct sigaction action = {};
    action.sa_handler = &UnixSignalWatcher::handleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    if (::sigaction(signum, &action, nullptr) != 0) {
        qCWarning(lcCore) << "Cannot install handler for signal" << signum << ":" << std::strerror(errno);
        return false;
    }

    m_watched.append(signum);
    return true;
}

void UnixSignalWatcher::handleSignal(int signum)
{
    // Async-signal context: write(2) only
    const int savedErrno = errno;
    const ssize_t written = ::write(s_sockets[0], &signum, sizeof(signum));
    Q_UNUSED(written)
    errno = savedErrno;
}

void UnixSignalWatcher::readSignal()
{
    int signum = 0;
    const ssize_t bytes = ::read(s_sockets[1], &signum, sizeof(signum));
    if (bytes != static_cast<ssize_t>(sizeof(signum))) {
        qCWarning(lcCore) << "Short read on signal socket:" << bytes;
        return;
    }

    qCDebug(lcCore) << "Received signal" << signum;
    Q_EMIT unixSignal(signum);
}

} // namespace DropHint
