// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>
#include <QFile>
#include <QStandardPaths>
#include <limits>

#include <KConfigGroup>
#include <KSharedConfig>

#include "config/settings.h"
#include "core/constants.h"

using namespace DropHint;

/**
 * @brief Unit tests for the KConfig-backed Settings
 *
 * Runs against drophintrc in the QStandardPaths test location, which is
 * wiped before every test.
 */
class TestSettings : public QObject
{
    Q_OBJECT

private:
    static QString configPath()
    {
        return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
            + QStringLiteral("/drophintrc");
    }

    static KConfigGroup group(const QString& name)
    {
        return KSharedConfig::openConfig(QStringLiteral("drophintrc"))->group(name);
    }

    static void syncConfig()
    {
        QVERIFY(KSharedConfig::openConfig(QStringLiteral("drophintrc"))->sync());
    }

private Q_SLOTS:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
    }

    void init()
    {
        QFile::remove(configPath());
        KSharedConfig::openConfig(QStringLiteral("drophintrc"))->reparseConfiguration();
    }

    void cleanupTestCase()
    {
        QFile::remove(configPath());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Loading
    // ═══════════════════════════════════════════════════════════════════════════

    void test_defaultsWithoutConfigFile()
    {
        Settings settings;

        QCOMPARE(settings.displayMargin(), 16);
        QCOMPARE(settings.marginEnterDuration(), 400);
        QCOMPARE(settings.marginExitDuration(), 250);
        QCOMPARE(settings.backgroundDuration(), 300);
        QCOMPARE(settings.useSystemColors(), true);
        QCOMPARE(settings.highlightColor(), QColor(0, 120, 212));
        QCOMPARE(settings.highlightAlpha(), 0.9);
        QCOMPARE(settings.cornerRadius(), 16);
    }

    void test_loadReadsStoredValues()
    {
        group(QStringLiteral("Layout")).writeEntry("DisplayMargin", 24);
        group(QStringLiteral("Animation")).writeEntry("MarginEnterDuration", 600);
        group(QStringLiteral("Animation")).writeEntry("MarginExitDuration", 150);
        group(QStringLiteral("Appearance")).writeEntry("UseSystemColors", false);
        group(QStringLiteral("Appearance")).writeEntry("HighlightColor", QColor(10, 20, 30));
        group(QStringLiteral("Appearance")).writeEntry("HighlightAlpha", 0.5);
        syncConfig();

        Settings settings;

        QCOMPARE(settings.displayMargin(), 24);
        QCOMPARE(settings.marginEnterDuration(), 600);
        QCOMPARE(settings.marginExitDuration(), 150);
        QCOMPARE(settings.backgroundDuration(), 300);
        QCOMPARE(settings.useSystemColors(), false);
        QCOMPARE(settings.highlightColor(), QColor(10, 20, 30));
        QCOMPARE(settings.highlightAlpha(), 0.5);
    }

    void test_loadRejectsOutOfRange()
    {
        group(QStringLiteral("Layout")).writeEntry("DisplayMargin", -5);
        group(QStringLiteral("Animation")).writeEntry("MarginEnterDuration", 99999);
        group(QStringLiteral("Appearance")).writeEntry("HighlightAlpha", 3.0);
        group(QStringLiteral("Appearance")).writeEntry("CornerRadius", 1000);
        syncConfig();

        Settings settings;

        QCOMPARE(settings.displayMargin(), Defaults::DisplayMargin);
        QCOMPARE(settings.marginEnterDuration(), Defaults::MarginEnterDurationMs);
        QCOMPARE(settings.highlightAlpha(), Defaults::HighlightAlpha);
        QCOMPARE(settings.cornerRadius(), Defaults::CornerRadius);
    }

    void test_loadRejectsNonFiniteAlpha_data()
    {
        QTest::addColumn<QString>("stored");

        QTest::newRow("nan") << QStringLiteral("nan");
        QTest::newRow("inf") << QStringLiteral("inf");
        QTest::newRow("-inf") << QStringLiteral("-inf");
    }

    void test_loadRejectsNonFiniteAlpha()
    {
        QFETCH(QString, stored);

        group(QStringLiteral("Appearance")).writeEntry("HighlightAlpha", stored);
        syncConfig();

        Settings settings;
        QCOMPARE(settings.highlightAlpha(), Defaults::HighlightAlpha);

        settings.setUseSystemColors(false);
        const ThemeResources theme = settings.themeResources();
        QVERIFY(qAbs(theme.highlightColor.alphaF() - Defaults::HighlightAlpha) < 0.01);
    }

    void test_loadRejectsInvalidColor()
    {
        group(QStringLiteral("Appearance")).writeEntry("HighlightColor", QStringLiteral("not a color"));
        syncConfig();

        Settings settings;
        QVERIFY(settings.highlightColor().isValid());
        QCOMPARE(settings.highlightColor(), QColor(0, 120, 212));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Setters
    // ═══════════════════════════════════════════════════════════════════════════

    void test_setters_clampAndNotify()
    {
        Settings settings;
        QSignalSpy marginSpy(&settings, &ISettings::displayMarginChanged);
        QSignalSpy durationSpy(&settings, &ISettings::animationDurationsChanged);
        QSignalSpy anySpy(&settings, &ISettings::settingsChanged);

        settings.setDisplayMargin(1000);
        QCOMPARE(settings.displayMargin(), Defaults::MaxDisplayMargin);
        settings.setDisplayMargin(Defaults::MaxDisplayMargin);
        QCOMPARE(marginSpy.count(), 1);

        settings.setMarginExitDuration(-10);
        QCOMPARE(settings.marginExitDuration(), 0);
        QCOMPARE(durationSpy.count(), 1);

        settings.setHighlightAlpha(1.5);
        QCOMPARE(settings.highlightAlpha(), 1.0);

        QCOMPARE(anySpy.count(), 3);
    }

    void test_setHighlightAlpha_rejectsNonFinite()
    {
        Settings settings;
        QSignalSpy spy(&settings, &ISettings::highlightAlphaChanged);

        settings.setHighlightAlpha(std::numeric_limits<qreal>::quiet_NaN());
        settings.setHighlightAlpha(std::numeric_limits<qreal>::infinity());

        QCOMPARE(settings.highlightAlpha(), Defaults::HighlightAlpha);
        QCOMPARE(spy.count(), 0);
    }

    void test_setHighlightColor_rejectsInvalid()
    {
        Settings settings;
        QSignalSpy spy(&settings, &ISettings::highlightColorChanged);

        settings.setHighlightColor(QColor());
        QCOMPARE(settings.highlightColor(), QColor(0, 120, 212));
        QCOMPARE(spy.count(), 0);

        settings.setHighlightColor(Qt::red);
        QCOMPARE(settings.highlightColor(), QColor(Qt::red));
        QCOMPARE(spy.count(), 1);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Persistence
    // ═══════════════════════════════════════════════════════════════════════════

    void test_saveThenLoad()
    {
        {
            Settings settings;
            settings.setDisplayMargin(40);
            settings.setBackgroundDuration(120);
            settings.setUseSystemColors(false);
            settings.setCornerRadius(8);
            settings.save();
        }

        Settings reloaded;
        QCOMPARE(reloaded.displayMargin(), 40);
        QCOMPARE(reloaded.backgroundDuration(), 120);
        QCOMPARE(reloaded.useSystemColors(), false);
        QCOMPARE(reloaded.cornerRadius(), 8);
    }

    void test_reset_restoresDefaults()
    {
        Settings settings;
        settings.setDisplayMargin(40);
        settings.setMarginEnterDuration(900);
        settings.save();

        QSignalSpy spy(&settings, &ISettings::settingsChanged);
        settings.reset();

        QCOMPARE(settings.displayMargin(), 16);
        QCOMPARE(settings.marginEnterDuration(), 400);
        QCOMPARE(spy.count(), 1);

        Settings reloaded;
        QCOMPARE(reloaded.displayMargin(), 16);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Theme resolution
    // ═══════════════════════════════════════════════════════════════════════════

    void test_themeResources_customColor()
    {
        Settings settings;
        settings.setUseSystemColors(false);
        settings.setHighlightColor(QColor(200, 100, 50));
        settings.setHighlightAlpha(0.5);
        settings.setCornerRadius(12);

        const ThemeResources theme = settings.themeResources();
        QCOMPARE(theme.highlightColor.rgb(), QColor(200, 100, 50).rgb());
        QVERIFY(qAbs(theme.highlightColor.alphaF() - 0.5) < 0.01);
        QCOMPARE(theme.cornerRadius, 12.0);
    }

    void test_themeResources_systemColorAppliesAlpha()
    {
        Settings settings;
        settings.setUseSystemColors(true);
        settings.setHighlightAlpha(0.25);

        const ThemeResources theme = settings.themeResources();
        QVERIFY(theme.highlightColor.isValid());
        QVERIFY(qAbs(theme.highlightColor.alphaF() - 0.25) < 0.01);
    }
};

QTEST_MAIN(TestSettings)
#include "test_settings.moc"
