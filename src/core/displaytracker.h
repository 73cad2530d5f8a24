// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drophint_export.h"
#include "types.h"
#include <QList>
#include <QMargins>
#include <QMetaObject>
#include <QObject>
#include <QPointer>

class QScreen;

namespace DropHint {

/**
 * @brief Follows the primary screen and reports hinting-relevant changes
 *
 * Produces a DisplayConfiguration from the primary QScreen (size and
 * orientation), the platform color scheme (UI mode) and application
 * palette changes (assets). Bottom insets come from the difference between
 * the screen geometry and its available geometry.
 *
 * Emits configurationChanged() only when the configuration really differs
 * and insetsChanged() only when the insets differ.
 */
class DROPHINT_EXPORT DisplayTracker : public QObject
{
    Q_OBJECT

public:
    explicit DisplayTracker(QObject* parent = nullptr);
    ~DisplayTracker() override;

    /**
     * @brief Start following screen and theme changes
     */
    void start();

    /**
     * @brief Stop following changes
     */
    void stop();

    DisplayConfiguration configuration() const
    {
        return m_configuration;
    }
    QMargins insets() const
    {
        return m_insets;
    }

    /**
     * @brief Build a configuration from @p screen
     *
     * A null screen yields an empty display size.
     */
    static DisplayConfiguration configurationFor(QScreen* screen, int uiMode, int assetsSeq);

    /**
     * @brief System insets of @p screen (panels reserved outside the available geometry)
     */
    static QMargins insetsFor(QScreen* screen);

Q_SIGNALS:
    void configurationChanged(const DropHint::DisplayConfiguration& config);
    void insetsChanged(const QMargins& insets);

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private Q_SLOTS:
    void onPrimaryScreenChanged(QScreen* screen);
    void refresh();

private:
    void connectScreen(QScreen* screen);
    void disconnectScreen();
    int currentUiMode() const;

    QPointer<QScreen> m_screen;
    QList<QMetaObject::Connection> m_screenConnections;
    DisplayConfiguration m_configuration;
    QMargins m_insets;
    int m_assetsSeq = 0;
    bool m_running = false;
};

} // namespace DropHint
