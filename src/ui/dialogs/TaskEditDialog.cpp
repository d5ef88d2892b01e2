#include "planner/ui/dialogs/TaskEditDialog.hpp"

#include <QCheckBox>
#include <QDateEdit>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QPushButton>
#include <QRegularExpression>
#include <QVBoxLayout>

namespace planner {
namespace ui {

TaskEditDialog::TaskEditDialog(QWidget *parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Aufgabe bearbeiten"));
    auto *layout = new QVBoxLayout(this);
    auto *formLayout = new QFormLayout();

    m_titleEdit = new QLineEdit(this);
    formLayout->addRow(tr("Titel"), m_titleEdit);

    m_descriptionEdit = new QLineEdit(this);
    formLayout->addRow(tr("Beschreibung"), m_descriptionEdit);

    m_urgentCheck = new QCheckBox(tr("Dringend"), this);
    m_importantCheck = new QCheckBox(tr("Wichtig"), this);
    auto *flagsLayout = new QHBoxLayout();
    flagsLayout->addWidget(m_urgentCheck);
    flagsLayout->addWidget(m_importantCheck);
    flagsLayout->addStretch(1);
    formLayout->addRow(tr("Priorität"), flagsLayout);

    m_tagsEdit = new QLineEdit(this);
    m_tagsEdit->setPlaceholderText(tr("arbeit, privat"));
    formLayout->addRow(tr("Tags"), m_tagsEdit);

    m_dueCheck = new QCheckBox(this);
    m_dueEdit = new QDateEdit(this);
    m_dueEdit->setDisplayFormat(QStringLiteral("yyyy-MM-dd"));
    m_dueEdit->setCalendarPopup(true);
    m_dueEdit->setDateRange(QDate(1900, 1, 1), QDate(9999, 12, 31));
    m_dueEdit->setDate(QDate::currentDate());
    m_dueEdit->setEnabled(false);
    connect(m_dueCheck, &QCheckBox::toggled, m_dueEdit, &QDateEdit::setEnabled);
    auto *dueLayout = new QHBoxLayout();
    dueLayout->addWidget(m_dueCheck);
    dueLayout->addWidget(m_dueEdit, 1);
    formLayout->addRow(tr("Fällig"), dueLayout);

    m_completedCheck = new QCheckBox(tr("Erledigt"), this);
    formLayout->addRow(QString(), m_completedCheck);

    layout->addLayout(formLayout);

    auto *buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(m_titleEdit, &QLineEdit::textChanged, this, [buttonBox](const QString &text) {
        buttonBox->button(QDialogButtonBox::Ok)->setEnabled(!text.trimmed().isEmpty());
    });
    layout->addWidget(buttonBox);
}

void TaskEditDialog::setTask(const data::Task &task)
{
    m_titleEdit->setText(task.title);
    m_descriptionEdit->setText(task.description);
    m_urgentCheck->setChecked(task.urgent);
    m_importantCheck->setChecked(task.important);
    m_tagsEdit->setText(task.tags.join(QStringLiteral(", ")));
    m_dueCheck->setChecked(task.dueDate.isValid());
    m_dueEdit->setDate(task.dueDate.isValid() ? task.dueDate : QDate::currentDate());
    m_completedCheck->setChecked(task.completed);
}

data::TaskPatch TaskEditDialog::patch() const
{
    data::TaskPatch patch;
    patch.title = m_titleEdit->text();
    patch.description = m_descriptionEdit->text();
    patch.urgent = m_urgentCheck->isChecked();
    patch.important = m_importantCheck->isChecked();
    patch.tags = splitTags(m_tagsEdit->text());
    patch.dueDate = m_dueCheck->isChecked() ? m_dueEdit->date() : QDate();
    patch.completed = m_completedCheck->isChecked();
    return patch;
}

QStringList TaskEditDialog::splitTags(const QString &text)
{
    static const QRegularExpression separators(QStringLiteral("[,;\\s]+"));
    QStringList tags;
    for (QString tag : text.split(separators, Qt::SkipEmptyParts)) {
        if (tag.startsWith(QLatin1Char('#'))) {
            tag.remove(0, 1);
        }
        if (!tag.isEmpty()) {
            tags << tag;
        }
    }
    return tags;
}

} // namespace ui
} // namespace planner
