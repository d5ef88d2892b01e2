#include <QtTest/QtTest>

#include "planner/data/TaskErrors.hpp"
#include "planner/data/TaskStore.hpp"

using namespace planner::data;

namespace {
QStringList titlesOf(const std::vector<Task> &tasks)
{
    QStringList titles;
    for (const auto &task : tasks) {
        titles << task.title;
    }
    return titles;
}
} // namespace

class TaskStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void addAndFind();
    void addRejectsInvalidInput();
    void partitionsByQuadrant();
    void listsOpenByDueDateThenCompleted();
    void updateAppliesOnlyPresentFields();
    void updateWithEmptyTitleChangesNothing();
    void updateMovesTaskBetweenQuadrants();
    void toggleAndRemove();
    void unknownIdThrowsNotFound();
    void replaceFiresSingleReset();
    void replaceRejectsDuplicateIds();
    void listsByTag();
    void rejectsDueDateWithoutIsoForm();
    void flattensDescription();
    void renamesTagAcrossTasks();
};

void TaskStoreTest::addAndFind()
{
    TaskStore store;
    ChangeEvent lastEvent;
    int events = 0;
    store.notifier().subscribe([&](const ChangeEvent &event) {
        lastEvent = event;
        ++events;
    });

    const auto task = store.add(QStringLiteral("  Write report  "),
                                true,
                                true,
                                { QStringLiteral("#work"), QStringLiteral("work"), QStringLiteral("q1") },
                                QDate(2024, 3, 1));

    QVERIFY(!task.id.isNull());
    QCOMPARE(task.title, QStringLiteral("Write report"));
    QCOMPARE(task.tags, (QStringList{ QStringLiteral("work"), QStringLiteral("q1") }));
    QVERIFY(!task.completed);
    QCOMPARE(store.size(), std::size_t(1));
    QCOMPARE(events, 1);
    QCOMPARE(lastEvent.kind, ChangeEvent::Kind::Added);
    QCOMPARE(lastEvent.id, task.id);

    const auto found = store.findById(task.id);
    QVERIFY(found.has_value());
    QCOMPARE(found->dueDate, QDate(2024, 3, 1));
    QVERIFY(!store.findById(QUuid::createUuid()).has_value());
}

void TaskStoreTest::addRejectsInvalidInput()
{
    TaskStore store;
    int events = 0;
    store.notifier().subscribe([&events](const ChangeEvent &) { ++events; });

    QVERIFY_EXCEPTION_THROWN(store.add(QStringLiteral("   "), false, false), ValidationError);
    QVERIFY_EXCEPTION_THROWN(store.add(QStringLiteral("two\nlines"), false, false), ValidationError);
    QVERIFY_EXCEPTION_THROWN(store.add(QStringLiteral("ok"), false, false, { QStringLiteral("two words") }),
                             ValidationError);
    QVERIFY_EXCEPTION_THROWN(store.add(QStringLiteral("ok"), false, false, { QStringLiteral("#") }),
                             ValidationError);

    QVERIFY(store.isEmpty());
    QCOMPARE(events, 0);
}

void TaskStoreTest::partitionsByQuadrant()
{
    TaskStore store;
    store.add(QStringLiteral("a"), true, true);
    store.add(QStringLiteral("b"), false, true);
    store.add(QStringLiteral("c"), true, false);
    store.add(QStringLiteral("d"), false, false);
    store.add(QStringLiteral("e"), false, false);

    std::size_t total = 0;
    for (const auto quadrant : allQuadrants()) {
        const auto tasks = store.listByQuadrant(quadrant);
        for (const auto &task : tasks) {
            QCOMPARE(quadrantOf(task), quadrant);
        }
        total += tasks.size();
    }
    QCOMPARE(total, store.size());
    QCOMPARE(store.listByQuadrant(Quadrant::Eliminate).size(), std::size_t(2));
    QCOMPARE(store.snapshot().size(), std::size_t(5));
}

void TaskStoreTest::listsOpenByDueDateThenCompleted()
{
    TaskStore store;
    const auto c = store.add(QStringLiteral("C"), true, true, {}, QDate(2023, 12, 1));
    store.toggleCompleted(c.id);
    store.add(QStringLiteral("B"), true, true);
    store.add(QStringLiteral("A"), true, true, {}, QDate(2024, 1, 1));

    const auto tasks = store.listByQuadrant(Quadrant::DoFirst);
    QCOMPARE(titlesOf(tasks), (QStringList{ QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C") }));

    // Stable across calls.
    QCOMPARE(titlesOf(store.listByQuadrant(Quadrant::DoFirst)), titlesOf(tasks));
}

void TaskStoreTest::updateAppliesOnlyPresentFields()
{
    TaskStore store;
    const auto task = store.add(QStringLiteral("Plan trip"), false, true, { QStringLiteral("home") }, QDate(2024, 5, 1));

    TaskPatch patch;
    patch.title = QStringLiteral("Plan summer trip");
    const auto renamed = store.update(task.id, patch);
    QCOMPARE(renamed.title, QStringLiteral("Plan summer trip"));
    QCOMPARE(renamed.tags, QStringList{ QStringLiteral("home") });
    QCOMPARE(renamed.dueDate, QDate(2024, 5, 1));
    QVERIFY(renamed.important);

    TaskPatch clearDue;
    clearDue.dueDate = QDate();
    const auto cleared = store.update(task.id, clearDue);
    QVERIFY(!cleared.dueDate.isValid());
    QCOMPARE(cleared.title, QStringLiteral("Plan summer trip"));
}

void TaskStoreTest::updateWithEmptyTitleChangesNothing()
{
    TaskStore store;
    const auto task = store.add(QStringLiteral("Keep me"), true, false);
    int events = 0;
    store.notifier().subscribe([&events](const ChangeEvent &) { ++events; });

    TaskPatch patch;
    patch.title = QString();
    patch.important = true;
    QVERIFY_EXCEPTION_THROWN(store.update(task.id, patch), ValidationError);

    const auto stored = store.findById(task.id);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->title, QStringLiteral("Keep me"));
    QVERIFY(!stored->important);
    QCOMPARE(events, 0);
}

void TaskStoreTest::updateMovesTaskBetweenQuadrants()
{
    TaskStore store;
    const auto task = store.add(QStringLiteral("Move me"), false, false);
    QCOMPARE(store.listByQuadrant(Quadrant::Eliminate).size(), std::size_t(1));

    TaskPatch patch;
    patch.urgent = urgentFor(Quadrant::Schedule);
    patch.important = importantFor(Quadrant::Schedule);
    store.update(task.id, patch);

    QVERIFY(store.listByQuadrant(Quadrant::Eliminate).empty());
    const auto scheduled = store.listByQuadrant(Quadrant::Schedule);
    QCOMPARE(scheduled.size(), std::size_t(1));
    QCOMPARE(scheduled.front().id, task.id);
}

void TaskStoreTest::toggleAndRemove()
{
    TaskStore store;
    const auto task = store.add(QStringLiteral("Toggle"), false, false);
    QList<ChangeEvent::Kind> kinds;
    store.notifier().subscribe([&kinds](const ChangeEvent &event) { kinds << event.kind; });

    QVERIFY(store.toggleCompleted(task.id).completed);
    QVERIFY(!store.toggleCompleted(task.id).completed);
    store.remove(task.id);

    QVERIFY(store.isEmpty());
    QCOMPARE(kinds,
             (QList<ChangeEvent::Kind>{ ChangeEvent::Kind::Updated,
                                        ChangeEvent::Kind::Updated,
                                        ChangeEvent::Kind::Removed }));
}

void TaskStoreTest::unknownIdThrowsNotFound()
{
    TaskStore store;
    store.add(QStringLiteral("Existing"), false, false);
    const QUuid missing = QUuid::createUuid();

    QVERIFY_EXCEPTION_THROWN(store.remove(missing), NotFoundError);
    QVERIFY_EXCEPTION_THROWN(store.toggleCompleted(missing), NotFoundError);
    QVERIFY_EXCEPTION_THROWN(store.update(missing, TaskPatch()), NotFoundError);
    QCOMPARE(store.size(), std::size_t(1));
}

void TaskStoreTest::replaceFiresSingleReset()
{
    TaskStore store;
    store.add(QStringLiteral("Old"), false, false);
    QList<ChangeEvent::Kind> kinds;
    store.notifier().subscribe([&kinds](const ChangeEvent &event) { kinds << event.kind; });

    Task first;
    first.title = QStringLiteral("First");
    Task second;
    second.id = QUuid();
    second.title = QStringLiteral("Second");
    second.tags = { QStringLiteral("#x") };
    store.replace({ first, second });

    QCOMPARE(kinds, QList<ChangeEvent::Kind>{ ChangeEvent::Kind::Reset });
    QCOMPARE(store.size(), std::size_t(2));
    QVERIFY(store.findById(first.id).has_value());
    for (const auto &task : store.snapshot()) {
        QVERIFY(!task.id.isNull());
    }
    QCOMPARE(store.allTags(), QStringList{ QStringLiteral("x") });
}

void TaskStoreTest::replaceRejectsDuplicateIds()
{
    TaskStore store;
    const auto kept = store.add(QStringLiteral("Kept"), false, false);
    int events = 0;
    store.notifier().subscribe([&events](const ChangeEvent &) { ++events; });

    Task task;
    task.title = QStringLiteral("Twin");
    QVERIFY_EXCEPTION_THROWN(store.replace({ task, task }), ValidationError);

    QCOMPARE(store.size(), std::size_t(1));
    QVERIFY(store.findById(kept.id).has_value());
    QCOMPARE(events, 0);
}

void TaskStoreTest::listsByTag()
{
    TaskStore store;
    store.add(QStringLiteral("Gym"), false, true, { QStringLiteral("health") });
    store.add(QStringLiteral("Doctor"), true, true, { QStringLiteral("health"), QStringLiteral("admin") });
    store.add(QStringLiteral("Taxes"), true, false, { QStringLiteral("admin") });

    QCOMPARE(titlesOf(store.listByTag(QStringLiteral("#health"))),
             (QStringList{ QStringLiteral("Doctor"), QStringLiteral("Gym") }));
    QVERIFY(store.listByTag(QStringLiteral("unknown")).empty());
    QCOMPARE(store.allTags(), (QStringList{ QStringLiteral("admin"), QStringLiteral("health") }));
}

void TaskStoreTest::rejectsDueDateWithoutIsoForm()
{
    TaskStore store;
    int events = 0;
    store.notifier().subscribe([&events](const ChangeEvent &) { ++events; });

    QVERIFY_EXCEPTION_THROWN(store.add(QStringLiteral("Far future"), false, false, {}, QDate(10000, 1, 1)),
                             ValidationError);
    QVERIFY_EXCEPTION_THROWN(store.add(QStringLiteral("Before Christ"), false, false, {}, QDate(-44, 3, 15)),
                             ValidationError);
    QVERIFY(store.isEmpty());

    const auto task = store.add(QStringLiteral("Edge"), false, false, {}, QDate(9999, 12, 31));
    TaskPatch patch;
    patch.dueDate = QDate(12000, 6, 1);
    QVERIFY_EXCEPTION_THROWN(store.update(task.id, patch), ValidationError);
    QCOMPARE(store.findById(task.id)->dueDate, QDate(9999, 12, 31));

    Task invalid;
    invalid.title = QStringLiteral("Imported");
    invalid.dueDate = QDate(10001, 1, 1);
    QVERIFY_EXCEPTION_THROWN(store.replace({ invalid }), ValidationError);
    QCOMPARE(store.size(), std::size_t(1));
    QCOMPARE(events, 1);
}

void TaskStoreTest::flattensDescription()
{
    TaskStore store;
    const auto task = store.add(QStringLiteral("Notes"), false, true, {}, {}, QStringLiteral("  first line\r\n  second line \n"));
    QCOMPARE(task.description, QStringLiteral("first line second line"));

    TaskPatch patch;
    patch.description = QString();
    QVERIFY(store.update(task.id, patch).description.isEmpty());
    QCOMPARE(store.findById(task.id)->title, QStringLiteral("Notes"));
}

void TaskStoreTest::renamesTagAcrossTasks()
{
    TaskStore store;
    const auto a = store.add(QStringLiteral("A"), false, false, { QStringLiteral("work"), QStringLiteral("q1") });
    const auto b = store.add(QStringLiteral("B"), false, false, { QStringLiteral("job"), QStringLiteral("work") });
    store.add(QStringLiteral("C"), false, false, { QStringLiteral("home") });
    QList<QUuid> updated;
    store.notifier().subscribe([&updated](const ChangeEvent &event) { updated << event.id; });

    QCOMPARE(store.renameTag(QStringLiteral("#work"), QStringLiteral("job")), 2);
    QCOMPARE(store.findById(a.id)->tags, (QStringList{ QStringLiteral("job"), QStringLiteral("q1") }));
    QCOMPARE(store.findById(b.id)->tags, QStringList{ QStringLiteral("job") });
    QCOMPARE(updated.size(), 2);
    QVERIFY(updated.contains(a.id) && updated.contains(b.id));

    QCOMPARE(store.renameTag(QStringLiteral("missing"), QStringLiteral("other")), 0);
    QVERIFY_EXCEPTION_THROWN(store.renameTag(QStringLiteral("home"), QStringLiteral("two words")), ValidationError);
    QCOMPARE(store.allTags(), (QStringList{ QStringLiteral("home"), QStringLiteral("job"), QStringLiteral("q1") }));
    QCOMPARE(updated.size(), 2);
}

QTEST_GUILESS_MAIN(TaskStoreTest)
#include "TaskStoreTest.moc"
