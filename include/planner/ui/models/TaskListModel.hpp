#pragma once

#include <QAbstractListModel>
#include <QVector>

#include "planner/data/Task.hpp"

namespace planner {
namespace ui {

class TaskListModel : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles
    {
        TaskIdRole = Qt::UserRole + 1,
        TagsRole,
        DueDateRole,
        CompletedRole,
    };

    explicit TaskListModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    bool setData(const QModelIndex &index, const QVariant &value, int role) override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;
    Qt::DropActions supportedDragActions() const override;
    QMimeData *mimeData(const QModelIndexList &indexes) const override;
    QStringList mimeTypes() const override;

    void setTasks(QVector<data::Task> tasks);
    const data::Task *taskAt(const QModelIndex &index) const;

signals:
    // Emitted when the user ticks or unticks a task; the store owns the change.
    void completionToggleRequested(const QUuid &id);

private:
    QString displayText(const data::Task &task) const;

    QVector<data::Task> m_tasks;
};

} // namespace ui
} // namespace planner
