#include "planner/ui/viewmodels/QuadrantViewModel.hpp"

#include <QVector>

#include "planner/core/Logging.hpp"
#include "planner/data/TaskErrors.hpp"
#include "planner/data/TaskStore.hpp"
#include "planner/ui/models/TaskListModel.hpp"

namespace planner {
namespace ui {

QuadrantViewModel::QuadrantViewModel(data::TaskStore &store, data::Quadrant quadrant, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_quadrant(quadrant)
    , m_model(std::make_unique<TaskListModel>(this))
{
    m_subscription = m_store.notifier().subscribe([this](const data::ChangeEvent &) { refresh(); });
    // Queued: the refresh resets the model, which must not happen inside setData().
    connect(m_model.get(),
            &TaskListModel::completionToggleRequested,
            this,
            &QuadrantViewModel::toggleCompleted,
            Qt::QueuedConnection);
    refresh();
}

QuadrantViewModel::~QuadrantViewModel()
{
    m_store.notifier().unsubscribe(m_subscription);
}

TaskListModel *QuadrantViewModel::model() const
{
    return m_model.get();
}

data::Quadrant QuadrantViewModel::quadrant() const
{
    return m_quadrant;
}

int QuadrantViewModel::taskCount() const
{
    return m_model->rowCount();
}

void QuadrantViewModel::refresh()
{
    const auto tasks = m_store.listByQuadrant(m_quadrant);
    QVector<data::Task> items;
    items.reserve(static_cast<int>(tasks.size()));
    for (const auto &task : tasks) {
        items.append(task);
    }
    m_model->setTasks(std::move(items));
    emit tasksChanged();
}

void QuadrantViewModel::toggleCompleted(const QUuid &id)
{
    try {
        m_store.toggleCompleted(id);
    } catch (const data::NotFoundError &error) {
        qCWarning(lcPlannerUi) << "Cannot toggle task:" << error.what();
        refresh();
    }
}

} // namespace ui
} // namespace planner
