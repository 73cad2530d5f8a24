// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace DropHint {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "drophint.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcHint, "drophint.core.hint", QtInfoMsg)
Q_LOGGING_CATEGORY(lcZone, "drophint.core.zone", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "drophint.config", QtInfoMsg)

// D-Bus module categories
Q_LOGGING_CATEGORY(lcDbus, "drophint.dbus", QtInfoMsg)

// Daemon module categories
Q_LOGGING_CATEGORY(lcDaemon, "drophint.daemon", QtInfoMsg)

} // namespace DropHint
