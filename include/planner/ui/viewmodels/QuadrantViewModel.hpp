#pragma once

#include <QObject>
#include <memory>

#include "planner/data/ChangeNotifier.hpp"
#include "planner/data/QuadrantClassifier.hpp"

namespace planner {
namespace data {
class TaskStore;
}

namespace ui {

class TaskListModel;

/**
 * Keeps a TaskListModel in sync with one quadrant of a TaskStore.
 *
 * Subscribes to the store's notifier for its whole lifetime and refreshes
 * on every change. The store must outlive the view model.
 */
class QuadrantViewModel : public QObject
{
    Q_OBJECT
public:
    QuadrantViewModel(data::TaskStore &store, data::Quadrant quadrant, QObject *parent = nullptr);
    ~QuadrantViewModel() override;

    TaskListModel *model() const;
    data::Quadrant quadrant() const;
    int taskCount() const;

public slots:
    void refresh();
    void toggleCompleted(const QUuid &id);

signals:
    void tasksChanged();

private:
    data::TaskStore &m_store;
    data::Quadrant m_quadrant;
    std::unique_ptr<TaskListModel> m_model;
    data::SubscriptionToken m_subscription = 0;
};

} // namespace ui
} // namespace planner
