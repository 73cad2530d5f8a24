// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drophint_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for DropHint
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcHint) << "Debug message";
 *   qCInfo(lcCore) << "Info message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="drophint.*=true"                 # Enable all
 *   QT_LOGGING_RULES="drophint.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="drophint.core.zone.debug=true"   # Zone animation tracing
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing (classification changes, animation starts)
 *   qCInfo     - Significant operational events (startup, layout orientation switch)
 *   qCWarning  - Recoverable errors, invalid config values, missing dependencies
 *   qCCritical - System failures preventing normal operation
 */

namespace DropHint {

// Core module - overlay, classification, zone animation
DROPHINT_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
DROPHINT_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcHint)
DROPHINT_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcZone)

// Configuration module - settings loading/saving
DROPHINT_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

// D-Bus module - drag controller adaptor
DROPHINT_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

// Daemon module - startup, D-Bus registration
DROPHINT_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDaemon)

} // namespace DropHint
