#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <optional>

namespace planner {
namespace data {

struct Task
{
    QUuid id = QUuid::createUuid();
    QString title;
    QString description; // single line
    bool urgent = false;
    bool important = false;
    QStringList tags;
    QDate dueDate; // invalid: no deadline
    bool completed = false;
    QDateTime createdAt = QDateTime::currentDateTime();
};

// Fields left empty are not touched by TaskStore::update. A present but
// invalid dueDate clears the deadline.
struct TaskPatch
{
    std::optional<QString> title;
    std::optional<QString> description;
    std::optional<bool> urgent;
    std::optional<bool> important;
    std::optional<QStringList> tags;
    std::optional<QDate> dueDate;
    std::optional<bool> completed;
};

// Listing order inside a quadrant: open before done, earlier due date first,
// no due date last, then creation time. Title and id make the order total.
bool taskListingLess(const Task &lhs, const Task &rhs);

} // namespace data
} // namespace planner
