#pragma once

#include <QDialog>

#include "planner/data/Task.hpp"

class QCheckBox;
class QDateEdit;
class QLineEdit;

namespace planner {
namespace ui {

class TaskEditDialog : public QDialog
{
    Q_OBJECT

public:
    explicit TaskEditDialog(QWidget *parent = nullptr);

    void setTask(const data::Task &task);
    data::TaskPatch patch() const;

    static QStringList splitTags(const QString &text);

private:
    QLineEdit *m_titleEdit = nullptr;
    QLineEdit *m_descriptionEdit = nullptr;
    QCheckBox *m_urgentCheck = nullptr;
    QCheckBox *m_importantCheck = nullptr;
    QLineEdit *m_tagsEdit = nullptr;
    QCheckBox *m_dueCheck = nullptr;
    QDateEdit *m_dueEdit = nullptr;
    QCheckBox *m_completedCheck = nullptr;
};

} // namespace ui
} // namespace planner
