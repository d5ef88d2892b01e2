#pragma once

#include <QList>
#include <QMainWindow>
#include <QModelIndex>
#include <QUuid>
#include <array>
#include <memory>

#include "planner/data/QuadrantClassifier.hpp"
#include "planner/data/Task.hpp"

class QAction;
class QCheckBox;
class QLabel;
class QLineEdit;
class QListView;
class QToolBar;

namespace planner {
namespace core {
class AppContext;
}

namespace data {
struct ImportResult;
}

namespace ui {

class QuadrantViewModel;
class TaskFilterProxyModel;
class TaskListView;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

protected:
    void closeEvent(QCloseEvent *event) override;

private:
    struct QuadrantSection
    {
        std::unique_ptr<QuadrantViewModel> viewModel;
        std::unique_ptr<TaskFilterProxyModel> proxy;
        TaskListView *view = nullptr;
        QLabel *titleLabel = nullptr;
    };

    void setupUi();
    QToolBar *createToolBar();
    QWidget *createQuickAddBar();
    QWidget *createQuadrantGrid();
    QWidget *createSection(data::Quadrant quadrant, QWidget *parent);
    void setupShortcuts();
    void saveWindowState() const;
    void restoreWindowState();

    QuadrantSection &section(data::Quadrant quadrant);
    TaskFilterProxyModel *proxyForView(QListView *view) const;
    QString sectionTitle(data::Quadrant quadrant) const;
    void updateSectionTitle(data::Quadrant quadrant);
    void updateFilterText(const QString &text);
    void setHideCompleted(bool hide);
    void clearOtherSelections(QListView *except);
    QList<data::Task> selectedTasks() const;

    void addQuickTask();
    void editTask(const data::Task &task);
    void editSelectedTask();
    void toggleSelectedTasks();
    void deleteSelectedTasks();
    void handleTaskDoubleClicked(const QModelIndex &index);
    void handleTasksDropped(const QList<QUuid> &taskIds, data::Quadrant quadrant);
    void importFromFile();
    void importFromText();
    QString importSummary(const data::ImportResult &result) const;
    void exportToFile();
    void saveWorkspace();

    std::unique_ptr<core::AppContext> m_appContext;
    std::array<QuadrantSection, 4> m_sections;
    QLineEdit *m_searchField = nullptr;
    QLineEdit *m_quickAddField = nullptr;
    QCheckBox *m_urgentToggle = nullptr;
    QCheckBox *m_importantToggle = nullptr;
    QAction *m_hideCompletedAction = nullptr;
    QListView *m_activeView = nullptr;
};

} // namespace ui
} // namespace planner
