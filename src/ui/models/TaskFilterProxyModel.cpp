#include "planner/ui/models/TaskFilterProxyModel.hpp"

#include <algorithm>

#include "planner/ui/models/TaskListModel.hpp"

namespace planner {
namespace ui {

TaskFilterProxyModel::TaskFilterProxyModel(QObject *parent)
    : QSortFilterProxyModel(parent)
{
    setFilterCaseSensitivity(Qt::CaseInsensitive);
}

void TaskFilterProxyModel::setFilterText(const QString &text)
{
    if (m_filterText == text) {
        return;
    }
    m_filterText = text;
    invalidateFilter();
}

void TaskFilterProxyModel::setTagFilter(const QString &tag)
{
    QString normalized = tag.trimmed();
    if (normalized.startsWith(QLatin1Char('#'))) {
        normalized.remove(0, 1);
    }
    if (m_tagFilter == normalized) {
        return;
    }
    m_tagFilter = normalized;
    invalidateFilter();
}

void TaskFilterProxyModel::setHideCompleted(bool hide)
{
    if (m_hideCompleted == hide) {
        return;
    }
    m_hideCompleted = hide;
    invalidateFilter();
}

bool TaskFilterProxyModel::filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const
{
    const auto index = sourceModel()->index(sourceRow, 0, sourceParent);
    auto *taskModel = qobject_cast<TaskListModel *>(sourceModel());
    if (!taskModel) {
        return true;
    }
    const auto *task = taskModel->taskAt(index);
    if (!task) {
        return true;
    }

    if (m_hideCompleted && task->completed) {
        return false;
    }

    if (!m_tagFilter.isEmpty() && !task->tags.contains(m_tagFilter, Qt::CaseInsensitive)) {
        return false;
    }

    if (!m_filterText.isEmpty()) {
        const bool inTitle = task->title.contains(m_filterText, Qt::CaseInsensitive)
            || task->description.contains(m_filterText, Qt::CaseInsensitive);
        const bool inTags = std::any_of(task->tags.cbegin(), task->tags.cend(), [this](const QString &tag) {
            return tag.contains(m_filterText, Qt::CaseInsensitive);
        });
        if (!inTitle && !inTags) {
            return false;
        }
    }

    return true;
}

} // namespace ui
} // namespace planner
