#include <QtTest/QtTest>

#include <QDropEvent>
#include <QMimeData>

#include "planner/ui/mime/TaskMime.hpp"
#include "planner/ui/widgets/TaskListView.hpp"

using namespace planner;

class TaskListViewTest : public QObject
{
    Q_OBJECT

private slots:
    void dropLabelShowsDraggedTitle();
    void dropLabelCountsSeveralTasks();
    void emitsDroppedIdsForTargetQuadrant();
};

void TaskListViewTest::dropLabelShowsDraggedTitle()
{
    QMimeData mime;
    mime.setData(QString::fromLatin1(ui::TaskMimeType),
                 ui::encodeTaskMime({ { QUuid::createUuid(), QStringLiteral("Steuererklärung") } }));
    QCOMPARE(ui::TaskListView::dropLabel(&mime), QStringLiteral("Steuererklärung"));
}

void TaskListViewTest::dropLabelCountsSeveralTasks()
{
    QMimeData mime;
    mime.setData(QString::fromLatin1(ui::TaskMimeType),
                 ui::encodeTaskMime({ { QUuid::createUuid(), QStringLiteral("A") },
                                      { QUuid::createUuid(), QStringLiteral("B") } }));
    QVERIFY(ui::TaskListView::dropLabel(&mime).startsWith(QStringLiteral("2 ")));

    QMimeData foreign;
    foreign.setText(QStringLiteral("plain"));
    QVERIFY(!ui::TaskListView::dropLabel(&foreign).isEmpty());
}

void TaskListViewTest::emitsDroppedIdsForTargetQuadrant()
{
    ui::TaskListView view;
    view.setTargetQuadrant(data::Quadrant::Schedule);
    QCOMPARE(view.targetQuadrant(), data::Quadrant::Schedule);
    QCOMPARE(view.property("quadrant").toInt(), static_cast<int>(data::Quadrant::Schedule));

    const QUuid id = QUuid::createUuid();
    QMimeData mime;
    mime.setData(QString::fromLatin1(ui::TaskMimeType), ui::encodeTaskMime({ { id, QStringLiteral("Move") } }));

    QList<QUuid> droppedIds;
    data::Quadrant droppedOn = data::Quadrant::Eliminate;
    connect(&view, &ui::TaskListView::tasksDropped, this, [&](const QList<QUuid> &ids, data::Quadrant quadrant) {
        droppedIds = ids;
        droppedOn = quadrant;
    });

    QDropEvent event(QPointF(5, 5), Qt::MoveAction, &mime, Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(view.viewport(), &event);

    QCOMPARE(droppedIds, QList<QUuid>{ id });
    QCOMPARE(droppedOn, data::Quadrant::Schedule);
}

QTEST_MAIN(TaskListViewTest)
#include "TaskListViewTest.moc"
