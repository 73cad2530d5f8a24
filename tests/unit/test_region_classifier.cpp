// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QPointF>
#include <QRectF>

#include "core/regionclassifier.h"
#include "core/types.h"

using namespace DropHint;

/**
 * @brief Unit tests for RegionClassifier
 *
 * Display is 1000x2000 throughout, giving a left region of
 * (0,200)-(400,1800) and a right region of (600,200)-(1000,1800).
 */
class TestRegionClassifier : public QObject
{
    Q_OBJECT

private:
    // Drag rectangle of 100x100 centered on (x, y)
    static QRectF dragAt(qreal x, qreal y)
    {
        return QRectF(x - 50, y - 50, 100, 100);
    }

private Q_SLOTS:

    // ═══════════════════════════════════════════════════════════════════════════
    // classify() tests
    // ═══════════════════════════════════════════════════════════════════════════

    void test_classify_data()
    {
        QTest::addColumn<QPointF>("center");
        QTest::addColumn<int>("expected");

        QTest::newRow("left interior") << QPointF(100, 1000) << int(HintResult::Left);
        QTest::newRow("right interior") << QPointF(900, 1000) << int(HintResult::Right);
        QTest::newRow("middle band") << QPointF(500, 1000) << int(HintResult::None);
        QTest::newRow("above regions") << QPointF(100, 100) << int(HintResult::None);
        QTest::newRow("below regions") << QPointF(900, 1900) << int(HintResult::None);
        QTest::newRow("left inner edge") << QPointF(400, 1000) << int(HintResult::Left);
        QTest::newRow("right inner edge") << QPointF(600, 1000) << int(HintResult::Right);
        QTest::newRow("left top edge") << QPointF(0, 200) << int(HintResult::Left);
        QTest::newRow("right bottom edge") << QPointF(1000, 1800) << int(HintResult::Right);
        QTest::newRow("just past left edge") << QPointF(400.5, 1000) << int(HintResult::None);
        QTest::newRow("off screen") << QPointF(-10, 1000) << int(HintResult::None);
    }

    void test_classify()
    {
        QFETCH(QPointF, center);
        QFETCH(int, expected);

        RegionClassifier classifier(QSizeF(1000, 2000));
        QCOMPARE(int(RegionClassifier::classify(center, classifier.bounds(), true)), expected);
    }

    void test_classify_inactiveAlwaysNone()
    {
        RegionClassifier classifier(QSizeF(1000, 2000));
        for (const QPointF& p : {QPointF(100, 1000), QPointF(900, 1000), QPointF(500, 1000)}) {
            QCOMPARE(RegionClassifier::classify(p, classifier.bounds(), false), HintResult::None);
        }
    }

    void test_classify_overlapResolvesLeft()
    {
        ScreenBounds bounds;
        bounds.left = QRectF(0, 0, 600, 100);
        bounds.right = QRectF(400, 0, 600, 100);

        QCOMPARE(RegionClassifier::classify(QPointF(500, 50), bounds, true), HintResult::Left);
        QCOMPARE(RegionClassifier::classify(QPointF(700, 50), bounds, true), HintResult::Right);
    }

    void test_classify_unconfiguredDisplayNeverMatches()
    {
        RegionClassifier classifier;
        QCOMPARE(RegionClassifier::classify(QPointF(0, 0), classifier.bounds(), true), HintResult::None);

        classifier.setDisplaySize(QSizeF(0, 0));
        QCOMPARE(classifier.update(QRectF(0, 0, 0, 0), true), HintResult::None);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // update() tests
    // ═══════════════════════════════════════════════════════════════════════════

    void test_update_usesRectCenter()
    {
        RegionClassifier classifier(QSizeF(1000, 2000));

        // Rect starts in the middle band but its center is in the left region
        QCOMPARE(classifier.update(QRectF(300, 900, 200, 200), true), HintResult::Left);
        QCOMPARE(classifier.result(), HintResult::Left);

        // Rect overlaps the right region but its center does not
        QCOMPARE(classifier.update(QRectF(450, 900, 200, 200), true), HintResult::None);
    }

    void test_update_degenerateRect()
    {
        RegionClassifier classifier(QSizeF(1000, 2000));
        QCOMPARE(classifier.update(QRectF(900, 1000, 0, 0), true), HintResult::Right);
    }

    void test_update_sequence()
    {
        RegionClassifier classifier(QSizeF(1000, 2000));

        QCOMPARE(classifier.update(dragAt(100, 1000), true), HintResult::Left);
        QCOMPARE(classifier.update(dragAt(500, 1000), true), HintResult::None);
        QCOMPARE(classifier.update(dragAt(900, 1000), true), HintResult::Right);
        QCOMPARE(classifier.result(), HintResult::Right);
    }

    void test_update_inactiveOverridesGeometry()
    {
        RegionClassifier classifier(QSizeF(1000, 2000));
        QCOMPARE(classifier.update(dragAt(100, 1000), true), HintResult::Left);
        QCOMPARE(classifier.update(dragAt(100, 1000), false), HintResult::None);
        QCOMPARE(classifier.result(), HintResult::None);
    }

    void test_reset()
    {
        RegionClassifier classifier(QSizeF(1000, 2000));
        classifier.update(dragAt(900, 1000), true);
        classifier.reset();
        QCOMPARE(classifier.result(), HintResult::None);
    }

    void test_setDisplaySize_rebuildsRegions()
    {
        RegionClassifier classifier(QSizeF(1000, 2000));
        QCOMPARE(classifier.update(dragAt(1500, 500), true), HintResult::None);

        // Rotated to landscape
        classifier.setDisplaySize(QSizeF(2000, 1000));
        QCOMPARE(classifier.bounds().right, QRectF(QPointF(1200, 100), QPointF(2000, 900)));
        QCOMPARE(classifier.update(dragAt(1500, 500), true), HintResult::Right);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // hintResultToString
    // ═══════════════════════════════════════════════════════════════════════════

    void test_hintResultToString()
    {
        QCOMPARE(hintResultToString(HintResult::Left), QStringLiteral("left"));
        QCOMPARE(hintResultToString(HintResult::Right), QStringLiteral("right"));
        QCOMPARE(hintResultToString(HintResult::None), QStringLiteral("none"));
    }
};

QTEST_MAIN(TestRegionClassifier)
#include "test_region_classifier.moc"
