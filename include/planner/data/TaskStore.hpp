#pragma once

#include <QHash>
#include <optional>
#include <vector>

#include "planner/data/ChangeNotifier.hpp"
#include "planner/data/QuadrantClassifier.hpp"
#include "planner/data/Task.hpp"

namespace planner {
namespace data {

/**
 * In-memory owner of all tasks, keyed by id.
 *
 * Mutations validate first and change nothing on failure. Every successful
 * mutation is announced through notifier(). Not thread-safe; use from the
 * GUI thread only.
 */
class TaskStore
{
public:
    TaskStore();
    ~TaskStore();

    TaskStore(const TaskStore &) = delete;
    TaskStore &operator=(const TaskStore &) = delete;

    /// Throws ValidationError on an empty title, an invalid tag or a due
    /// date outside the years 1 to 9999.
    Task add(const QString &title,
             bool urgent,
             bool important,
             const QStringList &tags = {},
             const QDate &dueDate = {},
             const QString &description = {});
    /// Throws NotFoundError or ValidationError.
    Task update(const QUuid &id, const TaskPatch &patch);
    /// Throws NotFoundError.
    void remove(const QUuid &id);
    /// Throws NotFoundError.
    Task toggleCompleted(const QUuid &id);
    /// Swaps the whole collection and fires a single Reset. Throws
    /// ValidationError on duplicate ids or invalid tasks.
    void replace(std::vector<Task> tasks);
    /// Renames a tag on every task carrying it and returns the number of
    /// tasks changed. Throws ValidationError if newName is not a valid tag.
    int renameTag(const QString &oldName, const QString &newName);

    std::optional<Task> findById(const QUuid &id) const;
    std::vector<Task> listByQuadrant(Quadrant quadrant) const;
    std::vector<Task> listByTag(const QString &tag) const;
    std::vector<Task> snapshot() const;
    QStringList allTags() const;
    std::size_t size() const;
    bool isEmpty() const;

    ChangeNotifier &notifier();

    static QString normalizeTitle(const QString &title);
    static QStringList normalizeTags(const QStringList &tags);
    static QString normalizeDescription(const QString &description);
    static QDate checkedDueDate(const QDate &dueDate);
    static bool isValidTag(const QString &tag);

private:
    Task &taskOrThrow(const QUuid &id);

    QHash<QUuid, Task> m_tasks;
    ChangeNotifier m_notifier;
};

} // namespace data
} // namespace planner
