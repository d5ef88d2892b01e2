#include <QtTest/QtTest>

#include "planner/data/QuadrantClassifier.hpp"

using namespace planner::data;

class QuadrantClassifierTest : public QObject
{
    Q_OBJECT

private slots:
    void classifiesAllFlagCombinations();
    void flagsRoundTripThroughQuadrant();
    void headingsMatchDocumentOrder();
    void recognizesHeadingAliases();
    void rejectsUnknownHeadings();
};

void QuadrantClassifierTest::classifiesAllFlagCombinations()
{
    QCOMPARE(classify(true, true), Quadrant::DoFirst);
    QCOMPARE(classify(false, true), Quadrant::Schedule);
    QCOMPARE(classify(true, false), Quadrant::Delegate);
    QCOMPARE(classify(false, false), Quadrant::Eliminate);

    Task task;
    task.urgent = true;
    task.important = false;
    QCOMPARE(quadrantOf(task), Quadrant::Delegate);
}

void QuadrantClassifierTest::flagsRoundTripThroughQuadrant()
{
    for (const auto quadrant : allQuadrants()) {
        QCOMPARE(classify(urgentFor(quadrant), importantFor(quadrant)), quadrant);
    }
}

void QuadrantClassifierTest::headingsMatchDocumentOrder()
{
    const auto &quadrants = allQuadrants();
    QCOMPARE(quadrants.size(), std::size_t(4));
    QCOMPARE(quadrantHeading(quadrants[0]), QStringLiteral("Do First"));
    QCOMPARE(quadrantHeading(quadrants[1]), QStringLiteral("Schedule"));
    QCOMPARE(quadrantHeading(quadrants[2]), QStringLiteral("Delegate"));
    QCOMPARE(quadrantHeading(quadrants[3]), QStringLiteral("Eliminate"));

    for (const auto quadrant : quadrants) {
        QCOMPARE(quadrantFromHeading(quadrantHeading(quadrant)), std::optional<Quadrant>(quadrant));
    }
}

void QuadrantClassifierTest::recognizesHeadingAliases()
{
    QCOMPARE(quadrantFromHeading(QStringLiteral("  do first  ")), std::optional<Quadrant>(Quadrant::DoFirst));
    QCOMPARE(quadrantFromHeading(QStringLiteral("DoFirst")), std::optional<Quadrant>(Quadrant::DoFirst));
    QCOMPARE(quadrantFromHeading(QStringLiteral("Urgent and Important")),
             std::optional<Quadrant>(Quadrant::DoFirst));
    QCOMPARE(quadrantFromHeading(QStringLiteral("Schedule (3)")), std::optional<Quadrant>(Quadrant::Schedule));
    QCOMPARE(quadrantFromHeading(QString::fromUtf8("重要不紧急 (2)")),
             std::optional<Quadrant>(Quadrant::Schedule));
    QCOMPARE(quadrantFromHeading(QString::fromUtf8("紧急不重要")), std::optional<Quadrant>(Quadrant::Delegate));
    QCOMPARE(quadrantFromHeading(QStringLiteral("ELIMINATE")), std::optional<Quadrant>(Quadrant::Eliminate));
}

void QuadrantClassifierTest::rejectsUnknownHeadings()
{
    QVERIFY(!quadrantFromHeading(QStringLiteral("Tasks")).has_value());
    QVERIFY(!quadrantFromHeading(QStringLiteral("Notes")).has_value());
    QVERIFY(!quadrantFromHeading(QString()).has_value());
}

QTEST_GUILESS_MAIN(QuadrantClassifierTest)
#include "QuadrantClassifierTest.moc"
