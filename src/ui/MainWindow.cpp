#include "planner/ui/MainWindow.hpp"

#include <QAbstractItemView>
#include <QAction>
#include <QCheckBox>
#include <QCloseEvent>
#include <QDateTime>
#include <QDialog>
#include <QDialogButtonBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QItemSelectionModel>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QSettings>
#include <QShortcut>
#include <QSignalBlocker>
#include <QStatusBar>
#include <QToolBar>
#include <QVBoxLayout>
#include <algorithm>

#include "planner/core/AppContext.hpp"
#include "planner/core/AppSettings.hpp"
#include "planner/core/Logging.hpp"
#include "planner/data/DataProvider.hpp"
#include "planner/data/MarkdownCodec.hpp"
#include "planner/data/TaskErrors.hpp"
#include "planner/data/TaskStore.hpp"
#include "planner/ui/dialogs/TaskEditDialog.hpp"
#include "planner/ui/models/TaskFilterProxyModel.hpp"
#include "planner/ui/models/TaskListModel.hpp"
#include "planner/ui/viewmodels/QuadrantViewModel.hpp"
#include "planner/ui/widgets/TaskListView.hpp"

namespace planner {
namespace ui {

namespace {
constexpr int StatusTimeout = 2000;

int sectionIndex(data::Quadrant quadrant)
{
    return static_cast<int>(quadrant);
}
} // namespace

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_appContext(std::make_unique<core::AppContext>())
{
    for (const auto quadrant : data::allQuadrants()) {
        auto &entry = section(quadrant);
        entry.viewModel = std::make_unique<QuadrantViewModel>(m_appContext->taskStore(), quadrant);
        entry.proxy = std::make_unique<TaskFilterProxyModel>();
        entry.proxy->setSourceModel(entry.viewModel->model());
        entry.proxy->setHideCompleted(m_appContext->settings().hideCompleted());
    }
    setupUi();
    restoreWindowState();
}

MainWindow::~MainWindow() = default;

void MainWindow::closeEvent(QCloseEvent *event)
{
    saveWindowState();
    if (!m_appContext->shutdown()) {
        const auto answer = QMessageBox::question(this,
                                                  tr("Speichern fehlgeschlagen"),
                                                  tr("Die Aufgaben konnten nicht gespeichert werden.\n%1\n\nTrotzdem beenden?")
                                                      .arg(m_appContext->dataProvider().workspaceFile()));
        if (answer != QMessageBox::Yes) {
            event->ignore();
            return;
        }
    }
    event->accept();
}

void MainWindow::setupUi()
{
    setWindowTitle(tr("Quadrant Planner"));
    resize(1100, 760);

    addToolBar(Qt::TopToolBarArea, createToolBar());

    auto *centralWidget = new QWidget(this);
    auto *layout = new QVBoxLayout(centralWidget);
    layout->setContentsMargins(8, 8, 8, 8);
    layout->setSpacing(6);

    m_searchField = new QLineEdit(centralWidget);
    m_searchField->setPlaceholderText(tr("Suche…"));
    m_searchField->setClearButtonEnabled(true);
    connect(m_searchField, &QLineEdit::textChanged, this, &MainWindow::updateFilterText);

    layout->addWidget(m_searchField);
    layout->addWidget(createQuickAddBar());
    layout->addWidget(createQuadrantGrid(), 1);

    setCentralWidget(centralWidget);
    setupShortcuts();
    statusBar()->showMessage(tr("Bereit"));
}

QToolBar *MainWindow::createToolBar()
{
    auto *toolbar = new QToolBar(tr("Aufgaben"), this);
    toolbar->setMovable(false);

    auto *newAction = toolbar->addAction(tr("Neu"));
    newAction->setShortcut(QKeySequence::New);
    connect(newAction, &QAction::triggered, this, [this]() {
        m_quickAddField->setFocus(Qt::ShortcutFocusReason);
        m_quickAddField->selectAll();
    });

    auto *editAction = toolbar->addAction(tr("Bearbeiten"));
    editAction->setShortcut(QKeySequence(Qt::Key_F2));
    connect(editAction, &QAction::triggered, this, &MainWindow::editSelectedTask);

    auto *toggleAction = toolbar->addAction(tr("Erledigt"));
    toggleAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_D));
    connect(toggleAction, &QAction::triggered, this, &MainWindow::toggleSelectedTasks);

    auto *deleteAction = toolbar->addAction(tr("Löschen"));
    deleteAction->setShortcut(QKeySequence::Delete);
    connect(deleteAction, &QAction::triggered, this, &MainWindow::deleteSelectedTasks);

    toolbar->addSeparator();

    auto *importAction = toolbar->addAction(tr("Importieren…"));
    importAction->setShortcut(QKeySequence::Open);
    connect(importAction, &QAction::triggered, this, &MainWindow::importFromFile);

    auto *importTextAction = toolbar->addAction(tr("Aus Text importieren…"));
    importTextAction->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_V));
    connect(importTextAction, &QAction::triggered, this, &MainWindow::importFromText);

    auto *exportAction = toolbar->addAction(tr("Exportieren…"));
    exportAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_E));
    connect(exportAction, &QAction::triggered, this, &MainWindow::exportToFile);

    auto *saveAction = toolbar->addAction(tr("Speichern"));
    saveAction->setShortcut(QKeySequence::Save);
    connect(saveAction, &QAction::triggered, this, &MainWindow::saveWorkspace);

    toolbar->addSeparator();

    m_hideCompletedAction = toolbar->addAction(tr("Erledigte ausblenden"));
    m_hideCompletedAction->setCheckable(true);
    m_hideCompletedAction->setChecked(m_appContext->settings().hideCompleted());
    m_hideCompletedAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_H));
    connect(m_hideCompletedAction, &QAction::toggled, this, &MainWindow::setHideCompleted);

    return toolbar;
}

QWidget *MainWindow::createQuickAddBar()
{
    auto *bar = new QWidget(this);
    auto *layout = new QHBoxLayout(bar);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(6);

    m_quickAddField = new QLineEdit(bar);
    m_quickAddField->setPlaceholderText(tr("Neue Aufgabe, z.B. \"Angebot schreiben (due: 2024-05-01) #arbeit\""));
    connect(m_quickAddField, &QLineEdit::returnPressed, this, &MainWindow::addQuickTask);

    m_urgentToggle = new QCheckBox(tr("Dringend"), bar);
    m_importantToggle = new QCheckBox(tr("Wichtig"), bar);

    auto *addButton = new QPushButton(tr("Hinzufügen"), bar);
    connect(addButton, &QPushButton::clicked, this, &MainWindow::addQuickTask);

    layout->addWidget(m_quickAddField, 1);
    layout->addWidget(m_urgentToggle);
    layout->addWidget(m_importantToggle);
    layout->addWidget(addButton);
    return bar;
}

QWidget *MainWindow::createQuadrantGrid()
{
    auto *grid = new QWidget(this);
    auto *layout = new QGridLayout(grid);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(8);

    // Important on top, urgent on the left.
    layout->addWidget(createSection(data::Quadrant::DoFirst, grid), 0, 0);
    layout->addWidget(createSection(data::Quadrant::Schedule, grid), 0, 1);
    layout->addWidget(createSection(data::Quadrant::Delegate, grid), 1, 0);
    layout->addWidget(createSection(data::Quadrant::Eliminate, grid), 1, 1);
    return grid;
}

QWidget *MainWindow::createSection(data::Quadrant quadrant, QWidget *parent)
{
    auto &entry = section(quadrant);

    auto *container = new QWidget(parent);
    auto *sectionLayout = new QVBoxLayout(container);
    sectionLayout->setContentsMargins(0, 0, 0, 0);
    sectionLayout->setSpacing(2);

    entry.titleLabel = new QLabel(container);
    QFont labelFont = entry.titleLabel->font();
    labelFont.setBold(true);
    entry.titleLabel->setFont(labelFont);
    sectionLayout->addWidget(entry.titleLabel);

    auto *view = new TaskListView(container);
    view->setObjectName(QStringLiteral("taskList"));
    view->setSelectionMode(QAbstractItemView::ExtendedSelection);
    view->setSelectionBehavior(QAbstractItemView::SelectRows);
    view->setUniformItemSizes(true);
    view->setToolTip(tr("Aufgaben per Drag & Drop in einen anderen Quadranten ziehen"));
    view->setTargetQuadrant(quadrant);
    view->setModel(entry.proxy.get());
    connect(view->selectionModel(),
            &QItemSelectionModel::selectionChanged,
            this,
            [this, view](const QItemSelection &selected, const QItemSelection &) {
                if (selected.isEmpty()) {
                    return;
                }
                m_activeView = view;
                clearOtherSelections(view);
            });
    connect(view, &TaskListView::doubleClicked, this, &MainWindow::handleTaskDoubleClicked);
    connect(view, &TaskListView::tasksDropped, this, &MainWindow::handleTasksDropped);
    entry.view = view;

    connect(entry.viewModel.get(), &QuadrantViewModel::tasksChanged, this, [this, quadrant]() {
        updateSectionTitle(quadrant);
    });
    updateSectionTitle(quadrant);

    sectionLayout->addWidget(view, 1);
    return container;
}

void MainWindow::setupShortcuts()
{
    auto *focusSearchShortcut = new QShortcut(QKeySequence::Find, this);
    connect(focusSearchShortcut, &QShortcut::activated, this, [this]() {
        m_searchField->setFocus(Qt::ShortcutFocusReason);
        m_searchField->selectAll();
    });
}

void MainWindow::saveWindowState() const
{
    QSettings settings;
    settings.setValue(QStringLiteral("ui/geometry"), saveGeometry());
    settings.setValue(QStringLiteral("ui/windowState"), saveState());
}

void MainWindow::restoreWindowState()
{
    QSettings settings;
    const QByteArray geometry = settings.value(QStringLiteral("ui/geometry")).toByteArray();
    if (!geometry.isEmpty()) {
        restoreGeometry(geometry);
    }
    const QByteArray state = settings.value(QStringLiteral("ui/windowState")).toByteArray();
    if (!state.isEmpty()) {
        restoreState(state);
    }
}

MainWindow::QuadrantSection &MainWindow::section(data::Quadrant quadrant)
{
    return m_sections[static_cast<size_t>(sectionIndex(quadrant))];
}

TaskFilterProxyModel *MainWindow::proxyForView(QListView *view) const
{
    for (const auto &entry : m_sections) {
        if (entry.view == view) {
            return entry.proxy.get();
        }
    }
    return nullptr;
}

QString MainWindow::sectionTitle(data::Quadrant quadrant) const
{
    switch (quadrant) {
    case data::Quadrant::DoFirst:
        return tr("Sofort erledigen");
    case data::Quadrant::Schedule:
        return tr("Einplanen");
    case data::Quadrant::Delegate:
        return tr("Delegieren");
    case data::Quadrant::Eliminate:
    default:
        return tr("Weglassen");
    }
}

void MainWindow::updateSectionTitle(data::Quadrant quadrant)
{
    auto &entry = section(quadrant);
    if (!entry.titleLabel || !entry.viewModel) {
        return;
    }
    entry.titleLabel->setText(tr("%1 (%2)").arg(sectionTitle(quadrant)).arg(entry.viewModel->taskCount()));
}

void MainWindow::updateFilterText(const QString &text)
{
    const QString trimmed = text.trimmed();
    for (auto &entry : m_sections) {
        if (trimmed.startsWith(QLatin1Char('#')) && !trimmed.contains(QLatin1Char(' '))) {
            entry.proxy->setFilterText(QString());
            entry.proxy->setTagFilter(trimmed);
        } else {
            entry.proxy->setTagFilter(QString());
            entry.proxy->setFilterText(trimmed);
        }
    }
}

void MainWindow::setHideCompleted(bool hide)
{
    m_appContext->settings().setHideCompleted(hide);
    for (auto &entry : m_sections) {
        entry.proxy->setHideCompleted(hide);
    }
}

void MainWindow::clearOtherSelections(QListView *except)
{
    for (auto &entry : m_sections) {
        if (!entry.view || entry.view == except) {
            continue;
        }
        if (auto *selectionModel = entry.view->selectionModel()) {
            QSignalBlocker blocker(selectionModel);
            entry.view->clearSelection();
        }
    }
}

QList<data::Task> MainWindow::selectedTasks() const
{
    QList<data::Task> items;
    for (const auto &entry : m_sections) {
        if (!entry.view || !entry.view->selectionModel()) {
            continue;
        }
        auto indexes = entry.view->selectionModel()->selectedIndexes();
        std::sort(indexes.begin(), indexes.end(), [](const QModelIndex &lhs, const QModelIndex &rhs) {
            return lhs.row() < rhs.row();
        });
        for (const auto &index : indexes) {
            const QModelIndex sourceIndex = entry.proxy->mapToSource(index);
            if (const auto *task = entry.viewModel->model()->taskAt(sourceIndex)) {
                items.append(*task);
            }
        }
    }
    return items;
}

void MainWindow::addQuickTask()
{
    const QString text = m_quickAddField->text().trimmed();
    if (text.isEmpty()) {
        statusBar()->showMessage(tr("Keine Eingabe für neue Aufgabe"), StatusTimeout);
        return;
    }
    const data::TaskEntry entry = data::MarkdownCodec::parseEntry(text);
    try {
        const auto task = m_appContext->taskStore().add(entry.title,
                                                        m_urgentToggle->isChecked(),
                                                        m_importantToggle->isChecked(),
                                                        entry.tags,
                                                        entry.dueDate);
        m_quickAddField->clear();
        statusBar()->showMessage(tr("Aufgabe erstellt: %1").arg(task.title), StatusTimeout);
    } catch (const data::ValidationError &error) {
        statusBar()->showMessage(tr("Aufgabe ungültig: %1").arg(QString::fromUtf8(error.what())),
                                 StatusTimeout);
    }
}

void MainWindow::editTask(const data::Task &task)
{
    TaskEditDialog dialog(this);
    dialog.setTask(task);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }
    try {
        const auto updated = m_appContext->taskStore().update(task.id, dialog.patch());
        statusBar()->showMessage(tr("Aufgabe gespeichert: %1").arg(updated.title), StatusTimeout);
    } catch (const data::TaskError &error) {
        statusBar()->showMessage(tr("Aufgabe konnte nicht gespeichert werden: %1")
                                     .arg(QString::fromUtf8(error.what())),
                                 StatusTimeout);
    }
}

void MainWindow::editSelectedTask()
{
    const auto tasks = selectedTasks();
    if (tasks.isEmpty()) {
        statusBar()->showMessage(tr("Keine Aufgabe ausgewählt"), StatusTimeout);
        return;
    }
    editTask(tasks.first());
}

void MainWindow::toggleSelectedTasks()
{
    const auto tasks = selectedTasks();
    if (tasks.isEmpty()) {
        return;
    }
    int toggled = 0;
    for (const auto &task : tasks) {
        try {
            m_appContext->taskStore().toggleCompleted(task.id);
            ++toggled;
        } catch (const data::NotFoundError &error) {
            qCWarning(lcPlannerUi) << error.what();
        }
    }
    statusBar()->showMessage(tr("%1 Aufgabe(n) umgeschaltet").arg(toggled), StatusTimeout);
}

void MainWindow::deleteSelectedTasks()
{
    const auto tasks = selectedTasks();
    if (tasks.isEmpty()) {
        return;
    }
    int removed = 0;
    for (const auto &task : tasks) {
        try {
            m_appContext->taskStore().remove(task.id);
            ++removed;
        } catch (const data::NotFoundError &error) {
            qCWarning(lcPlannerUi) << error.what();
        }
    }
    m_activeView = nullptr;
    statusBar()->showMessage(tr("%1 Aufgabe(n) gelöscht").arg(removed), StatusTimeout);
}

void MainWindow::handleTaskDoubleClicked(const QModelIndex &index)
{
    auto *view = qobject_cast<QListView *>(sender());
    auto *proxy = proxyForView(view);
    if (!proxy) {
        return;
    }
    const QModelIndex sourceIndex = proxy->mapToSource(index);
    auto *model = qobject_cast<TaskListModel *>(proxy->sourceModel());
    if (!model) {
        return;
    }
    if (const auto *task = model->taskAt(sourceIndex)) {
        const data::Task copy = *task;
        editTask(copy);
    }
}

void MainWindow::handleTasksDropped(const QList<QUuid> &taskIds, data::Quadrant quadrant)
{
    auto &store = m_appContext->taskStore();
    int moved = 0;
    for (const auto &id : taskIds) {
        const auto task = store.findById(id);
        if (!task.has_value() || data::quadrantOf(*task) == quadrant) {
            continue;
        }
        data::TaskPatch patch;
        patch.urgent = data::urgentFor(quadrant);
        patch.important = data::importantFor(quadrant);
        store.update(id, patch);
        ++moved;
    }
    if (moved > 0) {
        statusBar()->showMessage(tr("%1 Aufgabe(n) nach \"%2\" verschoben").arg(moved).arg(sectionTitle(quadrant)),
                                 StatusTimeout);
    }
}

void MainWindow::importFromFile()
{
    const QString filePath = QFileDialog::getOpenFileName(this,
                                                          tr("Aufgaben importieren"),
                                                          m_appContext->settings().lastExportDirectory(),
                                                          tr("Markdown (*.md *.markdown);;Text (*.txt);;Alle Dateien (*)"));
    if (filePath.isEmpty()) {
        return;
    }

    QMessageBox question(this);
    question.setWindowTitle(tr("Aufgaben importieren"));
    question.setText(tr("Bestehende Aufgaben ersetzen oder die importierten anhängen?"));
    auto *replaceButton = question.addButton(tr("Ersetzen"), QMessageBox::DestructiveRole);
    auto *appendButton = question.addButton(tr("Anhängen"), QMessageBox::AcceptRole);
    question.addButton(QMessageBox::Cancel);
    question.setDefaultButton(appendButton);
    question.exec();
    if (question.clickedButton() != replaceButton && question.clickedButton() != appendButton) {
        return;
    }
    const auto mode = question.clickedButton() == replaceButton ? data::ImportMode::Replace : data::ImportMode::Append;

    const auto imported = m_appContext->dataProvider().importFrom(filePath, mode);
    if (!imported) {
        QMessageBox::warning(this,
                             tr("Import fehlgeschlagen"),
                             tr("Die Datei %1 konnte nicht als Text gelesen werden.").arg(filePath));
        return;
    }
    statusBar()->showMessage(importSummary(*imported), StatusTimeout);
}

void MainWindow::importFromText()
{
    QDialog dialog(this);
    dialog.setWindowTitle(tr("Aus Text importieren"));
    dialog.resize(520, 400);

    auto *layout = new QVBoxLayout(&dialog);
    auto *hint = new QLabel(tr("Markdown-Checkliste einfügen. Abschnitte \"## Do First\", \"## Schedule\", "
                               "\"## Delegate\" und \"## Eliminate\" bestimmen den Quadranten."),
                            &dialog);
    hint->setWordWrap(true);
    layout->addWidget(hint);

    auto *editor = new QPlainTextEdit(&dialog);
    editor->setPlaceholderText(QStringLiteral("## Do First\n- [ ] Bericht abgeben (due: 2024-03-20) #arbeit\n\n## Eliminate\n- [ ] Bücherregal sortieren"));
    layout->addWidget(editor, 1);

    auto *replaceCheck = new QCheckBox(tr("Bestehende Aufgaben ersetzen"), &dialog);
    layout->addWidget(replaceCheck);

    auto *buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, Qt::Horizontal, &dialog);
    layout->addWidget(buttonBox);
    connect(buttonBox, &QDialogButtonBox::accepted, &dialog, &QDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, &dialog, &QDialog::reject);

    if (dialog.exec() != QDialog::Accepted) {
        return;
    }
    const QString content = editor->toPlainText();
    if (content.trimmed().isEmpty()) {
        statusBar()->showMessage(tr("Keine Eingabe"), StatusTimeout);
        return;
    }
    const auto mode = replaceCheck->isChecked() ? data::ImportMode::Replace : data::ImportMode::Append;
    const auto imported = m_appContext->dataProvider().importText(content, mode);
    if (!imported) {
        statusBar()->showMessage(tr("Text konnte nicht importiert werden"), StatusTimeout);
        return;
    }
    if (imported->added == 0 && imported->skipped == 0) {
        statusBar()->showMessage(tr("Keine Aufgaben erkannt"), StatusTimeout);
        return;
    }
    statusBar()->showMessage(importSummary(*imported), StatusTimeout);
}

QString MainWindow::importSummary(const data::ImportResult &result) const
{
    if (result.skipped > 0) {
        return tr("%1 Aufgabe(n) importiert, %2 ohne Titel übersprungen").arg(result.added).arg(result.skipped);
    }
    return tr("%1 Aufgabe(n) importiert").arg(result.added);
}

void MainWindow::exportToFile()
{
    auto &settings = m_appContext->settings();
    const QString suggested = QStringLiteral("%1/tasks_%2.md")
                                  .arg(settings.lastExportDirectory(),
                                       QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_hhmmss")));
    const QString filePath = QFileDialog::getSaveFileName(this,
                                                          tr("Aufgaben exportieren"),
                                                          suggested,
                                                          tr("Markdown (*.md)"));
    if (filePath.isEmpty()) {
        return;
    }
    if (!m_appContext->dataProvider().exportTo(filePath)) {
        QMessageBox::warning(this, tr("Export fehlgeschlagen"), tr("%1 konnte nicht geschrieben werden.").arg(filePath));
        return;
    }
    settings.setLastExportDirectory(QFileInfo(filePath).absolutePath());
    statusBar()->showMessage(tr("Aufgaben exportiert nach %1").arg(filePath), StatusTimeout);
}

void MainWindow::saveWorkspace()
{
    auto &provider = m_appContext->dataProvider();
    if (!provider.save()) {
        statusBar()->showMessage(tr("Speichern fehlgeschlagen: %1").arg(provider.workspaceFile()), StatusTimeout);
        return;
    }
    statusBar()->showMessage(tr("Gespeichert"), StatusTimeout);
}

} // namespace ui
} // namespace planner
