#include "planner/ui/models/TaskListModel.hpp"

#include <QColor>
#include <QFont>
#include <QLocale>
#include <QMimeData>

#include "planner/ui/mime/TaskMime.hpp"

namespace planner {
namespace ui {

TaskListModel::TaskListModel(QObject *parent)
    : QAbstractListModel(parent)
{
}

int TaskListModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_tasks.size();
}

QVariant TaskListModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_tasks.size()) {
        return {};
    }

    const auto &task = m_tasks.at(index.row());
    switch (role) {
    case Qt::DisplayRole:
        return displayText(task);
    case Qt::EditRole:
        return task.title;
    case Qt::CheckStateRole:
        return task.completed ? Qt::Checked : Qt::Unchecked;
    case Qt::ToolTipRole: {
        QStringList lines{ task.title };
        if (!task.description.isEmpty()) {
            lines << task.description;
        }
        if (task.dueDate.isValid()) {
            lines << tr("Fällig: %1").arg(QLocale().toString(task.dueDate, QLocale::LongFormat));
        }
        if (!task.tags.isEmpty()) {
            lines << tr("Tags: %1").arg(task.tags.join(QStringLiteral(", ")));
        }
        return lines.join(QLatin1Char('\n'));
    }
    case Qt::ForegroundRole:
        if (task.completed) {
            return QColor(130, 130, 130);
        }
        if (task.dueDate.isValid() && task.dueDate < QDate::currentDate()) {
            return QColor(200, 40, 40);
        }
        return {};
    case Qt::FontRole:
        if (task.completed) {
            QFont font;
            font.setStrikeOut(true);
            return font;
        }
        return {};
    case TaskIdRole:
        return task.id;
    case TagsRole:
        return task.tags;
    case DueDateRole:
        return task.dueDate;
    case CompletedRole:
        return task.completed;
    default:
        return {};
    }
}

bool TaskListModel::setData(const QModelIndex &index, const QVariant &value, int role)
{
    if (role != Qt::CheckStateRole) {
        return false;
    }
    const auto *task = taskAt(index);
    if (!task) {
        return false;
    }
    const bool checked = static_cast<Qt::CheckState>(value.toInt()) == Qt::Checked;
    if (checked == task->completed) {
        return false;
    }
    emit completionToggleRequested(task->id);
    return true;
}

Qt::ItemFlags TaskListModel::flags(const QModelIndex &index) const
{
    auto defaultFlags = QAbstractListModel::flags(index);
    if (!index.isValid()) {
        return defaultFlags;
    }
    return defaultFlags | Qt::ItemIsDragEnabled | Qt::ItemIsSelectable | Qt::ItemIsEnabled
        | Qt::ItemIsUserCheckable;
}

Qt::DropActions TaskListModel::supportedDragActions() const
{
    return Qt::MoveAction;
}

QMimeData *TaskListModel::mimeData(const QModelIndexList &indexes) const
{
    auto *mime = new QMimeData();
    QList<TaskMimeEntry> entries;

    for (const auto &index : indexes) {
        const auto *task = taskAt(index);
        if (!task) {
            continue;
        }
        entries.append({ task->id, task->title });
    }
    mime->setData(TaskMimeType, encodeTaskMime(entries));
    return mime;
}

QStringList TaskListModel::mimeTypes() const
{
    return { QString::fromLatin1(TaskMimeType) };
}

void TaskListModel::setTasks(QVector<data::Task> tasks)
{
    beginResetModel();
    m_tasks = std::move(tasks);
    endResetModel();
}

const data::Task *TaskListModel::taskAt(const QModelIndex &index) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_tasks.size()) {
        return nullptr;
    }
    return &m_tasks.at(index.row());
}

QString TaskListModel::displayText(const data::Task &task) const
{
    QString display = task.title;
    if (task.dueDate.isValid()) {
        display += tr(" (fällig %1)").arg(QLocale().toString(task.dueDate, QLocale::ShortFormat));
    }
    for (const auto &tag : task.tags) {
        display += QStringLiteral(" #%1").arg(tag);
    }
    return display;
}

} // namespace ui
} // namespace planner
