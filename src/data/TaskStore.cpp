#include "planner/data/TaskStore.hpp"

#include <QRegularExpression>
#include <QSet>
#include <QVector>
#include <algorithm>

#include "planner/core/Logging.hpp"
#include "planner/data/TaskErrors.hpp"

namespace planner {
namespace data {

namespace {
bool containsWhitespace(const QString &value)
{
    return std::any_of(value.cbegin(), value.cend(), [](QChar ch) { return ch.isSpace(); });
}

void sortForListing(std::vector<Task> &tasks)
{
    std::sort(tasks.begin(), tasks.end(), [](const Task &lhs, const Task &rhs) {
        const auto lhsQuadrant = quadrantOf(lhs);
        const auto rhsQuadrant = quadrantOf(rhs);
        if (lhsQuadrant != rhsQuadrant) {
            return lhsQuadrant < rhsQuadrant;
        }
        return taskListingLess(lhs, rhs);
    });
}
} // namespace

TaskStore::TaskStore() = default;
TaskStore::~TaskStore() = default;

Task TaskStore::add(const QString &title,
                    bool urgent,
                    bool important,
                    const QStringList &tags,
                    const QDate &dueDate,
                    const QString &description)
{
    Task task;
    task.title = normalizeTitle(title);
    task.description = normalizeDescription(description);
    task.urgent = urgent;
    task.important = important;
    task.tags = normalizeTags(tags);
    task.dueDate = checkedDueDate(dueDate);
    task.completed = false;
    task.createdAt = QDateTime::currentDateTime();

    m_tasks.insert(task.id, task);
    qCDebug(lcPlannerStore) << "Added task" << task.id << task.title;
    m_notifier.notify({ ChangeEvent::Kind::Added, task.id });
    return task;
}

Task TaskStore::update(const QUuid &id, const TaskPatch &patch)
{
    Task updated = taskOrThrow(id);
    if (patch.title) {
        updated.title = normalizeTitle(*patch.title);
    }
    if (patch.description) {
        updated.description = normalizeDescription(*patch.description);
    }
    if (patch.tags) {
        updated.tags = normalizeTags(*patch.tags);
    }
    if (patch.urgent) {
        updated.urgent = *patch.urgent;
    }
    if (patch.important) {
        updated.important = *patch.important;
    }
    if (patch.dueDate) {
        updated.dueDate = checkedDueDate(*patch.dueDate);
    }
    if (patch.completed) {
        updated.completed = *patch.completed;
    }

    m_tasks.insert(id, updated);
    qCDebug(lcPlannerStore) << "Updated task" << id;
    m_notifier.notify({ ChangeEvent::Kind::Updated, id });
    return updated;
}

void TaskStore::remove(const QUuid &id)
{
    if (m_tasks.remove(id) == 0) {
        throw NotFoundError(QStringLiteral("No task with id %1").arg(id.toString()));
    }
    qCDebug(lcPlannerStore) << "Removed task" << id;
    m_notifier.notify({ ChangeEvent::Kind::Removed, id });
}

Task TaskStore::toggleCompleted(const QUuid &id)
{
    Task &task = taskOrThrow(id);
    task.completed = !task.completed;
    const Task result = task;
    qCDebug(lcPlannerStore) << "Toggled task" << id << "completed:" << result.completed;
    m_notifier.notify({ ChangeEvent::Kind::Updated, id });
    return result;
}

void TaskStore::replace(std::vector<Task> tasks)
{
    QHash<QUuid, Task> replacement;
    replacement.reserve(static_cast<int>(tasks.size()));
    for (auto &task : tasks) {
        if (task.id.isNull()) {
            task.id = QUuid::createUuid();
        }
        if (replacement.contains(task.id)) {
            throw ValidationError(QStringLiteral("Duplicate task id %1").arg(task.id.toString()));
        }
        task.title = normalizeTitle(task.title);
        task.tags = normalizeTags(task.tags);
        task.description = normalizeDescription(task.description);
        task.dueDate = checkedDueDate(task.dueDate);
        if (!task.createdAt.isValid()) {
            task.createdAt = QDateTime::currentDateTime();
        }
        replacement.insert(task.id, task);
    }

    m_tasks.swap(replacement);
    qCInfo(lcPlannerStore) << "Replaced task collection with" << m_tasks.size() << "tasks";
    m_notifier.notify({ ChangeEvent::Kind::Reset, QUuid() });
}

int TaskStore::renameTag(const QString &oldName, const QString &newName)
{
    QString from = oldName.trimmed();
    if (from.startsWith(QLatin1Char('#'))) {
        from.remove(0, 1);
    }
    const QStringList target = normalizeTags({ newName });
    const QString to = target.first();
    if (from == to) {
        return 0;
    }

    QVector<QUuid> changed;
    for (auto it = m_tasks.begin(); it != m_tasks.end(); ++it) {
        QStringList &tags = it.value().tags;
        const int index = tags.indexOf(from);
        if (index < 0) {
            continue;
        }
        if (tags.contains(to)) {
            tags.removeAt(index);
        } else {
            tags[index] = to;
        }
        changed.append(it.key());
    }

    qCDebug(lcPlannerStore) << "Renamed tag" << from << "to" << to << "on" << changed.size() << "tasks";
    for (const QUuid &id : changed) {
        m_notifier.notify({ ChangeEvent::Kind::Updated, id });
    }
    return changed.size();
}

std::optional<Task> TaskStore::findById(const QUuid &id) const
{
    const auto it = m_tasks.constFind(id);
    if (it == m_tasks.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

std::vector<Task> TaskStore::listByQuadrant(Quadrant quadrant) const
{
    std::vector<Task> result;
    for (const auto &task : m_tasks) {
        if (quadrantOf(task) == quadrant) {
            result.push_back(task);
        }
    }
    std::sort(result.begin(), result.end(), taskListingLess);
    return result;
}

std::vector<Task> TaskStore::listByTag(const QString &tag) const
{
    QString wanted = tag.trimmed();
    if (wanted.startsWith(QLatin1Char('#'))) {
        wanted.remove(0, 1);
    }
    std::vector<Task> result;
    for (const auto &task : m_tasks) {
        if (task.tags.contains(wanted)) {
            result.push_back(task);
        }
    }
    sortForListing(result);
    return result;
}

std::vector<Task> TaskStore::snapshot() const
{
    std::vector<Task> result;
    result.reserve(static_cast<size_t>(m_tasks.size()));
    for (const auto &task : m_tasks) {
        result.push_back(task);
    }
    sortForListing(result);
    return result;
}

QStringList TaskStore::allTags() const
{
    QSet<QString> unique;
    for (const auto &task : m_tasks) {
        for (const auto &tag : task.tags) {
            unique.insert(tag);
        }
    }
    QStringList tags(unique.cbegin(), unique.cend());
    tags.sort();
    return tags;
}

std::size_t TaskStore::size() const
{
    return static_cast<std::size_t>(m_tasks.size());
}

bool TaskStore::isEmpty() const
{
    return m_tasks.isEmpty();
}

ChangeNotifier &TaskStore::notifier()
{
    return m_notifier;
}

QString TaskStore::normalizeTitle(const QString &title)
{
    const QString trimmed = title.trimmed();
    if (trimmed.isEmpty()) {
        throw ValidationError(QStringLiteral("Task title must not be empty"));
    }
    if (trimmed.contains(QLatin1Char('\n')) || trimmed.contains(QLatin1Char('\r'))) {
        throw ValidationError(QStringLiteral("Task title must be a single line"));
    }
    return trimmed;
}

QStringList TaskStore::normalizeTags(const QStringList &tags)
{
    QStringList normalized;
    normalized.reserve(tags.size());
    for (const QString &raw : tags) {
        QString tag = raw.trimmed();
        if (tag.startsWith(QLatin1Char('#'))) {
            tag.remove(0, 1);
        }
        if (tag.isEmpty()) {
            throw ValidationError(QStringLiteral("Tags must not be empty"));
        }
        if (!isValidTag(tag)) {
            throw ValidationError(QStringLiteral("Invalid tag \"%1\"").arg(raw));
        }
        if (!normalized.contains(tag)) {
            normalized << tag;
        }
    }
    return normalized;
}

QString TaskStore::normalizeDescription(const QString &description)
{
    static const QRegularExpression lineBreaks(QStringLiteral("\\s*[\\r\\n]+\\s*"));
    QString flattened = description;
    flattened.replace(lineBreaks, QStringLiteral(" "));
    return flattened.trimmed();
}

QDate TaskStore::checkedDueDate(const QDate &dueDate)
{
    if (!dueDate.isValid()) {
        return {};
    }
    // Dates outside this range have no YYYY-MM-DD form.
    if (dueDate.year() < 1 || dueDate.year() > 9999) {
        throw ValidationError(QStringLiteral("Due date %1 is out of range").arg(dueDate.year()));
    }
    return dueDate;
}

bool TaskStore::isValidTag(const QString &tag)
{
    return !tag.isEmpty() && !containsWhitespace(tag) && !tag.contains(QLatin1Char('#'));
}

Task &TaskStore::taskOrThrow(const QUuid &id)
{
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        throw NotFoundError(QStringLiteral("No task with id %1").arg(id.toString()));
    }
    return it.value();
}

} // namespace data
} // namespace planner
