// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>
#include <limits>

#include "core/hintingoverlay.h"
#include "core/zoneanimator.h"
#include "dbus/hintingadaptor.h"

using namespace DropHint;

/**
 * @brief Unit tests for the org.drophint.Hinting adaptor
 *
 * The adaptor is exercised directly, without a bus connection.
 */
class TestHintingAdaptor : public QObject
{
    Q_OBJECT

private:
    static DisplayConfiguration portrait()
    {
        DisplayConfiguration config;
        config.displaySize = QSize(1000, 2000);
        config.orientation = DisplayOrientation::Portrait;
        return config;
    }

private Q_SLOTS:

    void test_update_returnsHintNames()
    {
        QObject host;
        HintingOverlay overlay(portrait(), nullptr);
        HintingAdaptor adaptor(&overlay, &host);

        adaptor.show();
        QCOMPARE(adaptor.update(50, 950, 100, 100), QStringLiteral("left"));
        QCOMPARE(adaptor.hintingResult(), QStringLiteral("left"));
        QCOMPARE(adaptor.update(850, 950, 100, 100), QStringLiteral("right"));
        QCOMPARE(adaptor.update(450, 950, 100, 100), QStringLiteral("none"));
    }

    void test_update_beforeShowIsNone()
    {
        QObject host;
        HintingOverlay overlay(portrait(), nullptr);
        HintingAdaptor adaptor(&overlay, &host);

        QCOMPARE(adaptor.update(50, 950, 100, 100), QStringLiteral("none"));
        QVERIFY(!overlay.firstZone()->isShowing());
    }

    void test_hide_forwardsToOverlay()
    {
        QObject host;
        HintingOverlay overlay(portrait(), nullptr);
        HintingAdaptor adaptor(&overlay, &host);

        adaptor.show();
        QVERIFY(overlay.isActive());
        adaptor.update(850, 950, 100, 100);
        QVERIFY(overlay.secondZone()->isShowing());

        adaptor.hide();
        QVERIFY(!overlay.isActive());
        QVERIFY(!overlay.secondZone()->isShowing());
        QCOMPARE(adaptor.hintingResult(), QStringLiteral("none"));
    }

    void test_signal_onlyOnChange()
    {
        QObject host;
        HintingOverlay overlay(portrait(), nullptr);
        HintingAdaptor adaptor(&overlay, &host);
        QSignalSpy spy(&adaptor, &HintingAdaptor::hintingResultChanged);

        adaptor.show();
        adaptor.update(50, 950, 100, 100);
        adaptor.update(60, 960, 100, 100);
        adaptor.update(850, 950, 100, 100);
        adaptor.hide();

        QCOMPARE(spy.count(), 3);
        QCOMPARE(spy.at(0).first().toString(), QStringLiteral("left"));
        QCOMPARE(spy.at(1).first().toString(), QStringLiteral("right"));
        QCOMPARE(spy.at(2).first().toString(), QStringLiteral("none"));
    }

    void test_update_rejectsNonFinite()
    {
        QObject host;
        HintingOverlay overlay(portrait(), nullptr);
        HintingAdaptor adaptor(&overlay, &host);

        adaptor.show();
        adaptor.update(50, 950, 100, 100);

        const double nan = std::numeric_limits<double>::quiet_NaN();
        const double inf = std::numeric_limits<double>::infinity();
        QCOMPARE(adaptor.update(nan, 950, 100, 100), QStringLiteral("left"));
        QCOMPARE(adaptor.update(50, 950, inf, 100), QStringLiteral("left"));
        QVERIFY(overlay.firstZone()->isShowing());
    }
};

QTEST_MAIN(TestHintingAdaptor)
#include "test_hinting_adaptor.moc"
