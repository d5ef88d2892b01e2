#include "planner/ui/widgets/TaskListView.hpp"

#include <QDragEnterEvent>
#include <QDragLeaveEvent>
#include <QDropEvent>
#include <QMimeData>
#include <QPainter>

#include "planner/ui/mime/TaskMime.hpp"

namespace planner {
namespace ui {

TaskListView::TaskListView(QWidget *parent)
    : QListView(parent)
{
    setDragEnabled(true);
    setAcceptDrops(true);
    setDropIndicatorShown(true);
    setDefaultDropAction(Qt::MoveAction);
    setDragDropMode(QAbstractItemView::DragDrop);
}

void TaskListView::setTargetQuadrant(data::Quadrant quadrant)
{
    m_targetQuadrant = quadrant;
    setProperty("quadrant", static_cast<int>(quadrant));
}

data::Quadrant TaskListView::targetQuadrant() const
{
    return m_targetQuadrant;
}

void TaskListView::dragEnterEvent(QDragEnterEvent *event)
{
    if (acceptTaskMime(event->mimeData())) {
        showDropLabel(dropLabel(event->mimeData()));
        event->acceptProposedAction();
        return;
    }
    clearDropLabel();
    QListView::dragEnterEvent(event);
}

void TaskListView::dragMoveEvent(QDragMoveEvent *event)
{
    if (acceptTaskMime(event->mimeData())) {
        event->acceptProposedAction();
        return;
    }
    QListView::dragMoveEvent(event);
}

void TaskListView::dragLeaveEvent(QDragLeaveEvent *event)
{
    clearDropLabel();
    QListView::dragLeaveEvent(event);
}

void TaskListView::dropEvent(QDropEvent *event)
{
    clearDropLabel();
    if (!acceptTaskMime(event->mimeData())) {
        QListView::dropEvent(event);
        return;
    }
    const QList<QUuid> ids = decodeTaskIds(event->mimeData());
    if (!ids.isEmpty()) {
        emit tasksDropped(ids, m_targetQuadrant);
    }
    event->acceptProposedAction();
}

void TaskListView::paintEvent(QPaintEvent *event)
{
    QListView::paintEvent(event);
    if (!m_dropHighlight || !viewport()) {
        return;
    }
    QPainter painter(viewport());
    painter.setRenderHint(QPainter::Antialiasing);
    QRectF rect = viewport()->rect().adjusted(4, 4, -4, -4);
    QColor outline = palette().highlight().color();
    painter.setBrush(Qt::NoBrush);
    painter.setPen(QPen(outline, 2, Qt::DashLine));
    painter.drawRoundedRect(rect, 8, 8);

    painter.setPen(palette().text().color());
    painter.drawText(rect.adjusted(8, 4, -8, -4), Qt::AlignCenter | Qt::TextWordWrap, m_dropLabel);
}

QString TaskListView::dropLabel(const QMimeData *mime)
{
    if (!mime || !mime->hasFormat(TaskMimeType)) {
        return tr("Aufgaben verschieben");
    }
    const auto entries = decodeTaskMime(mime->data(TaskMimeType));
    if (entries.isEmpty()) {
        return tr("Aufgaben verschieben");
    }
    if (entries.size() > 1) {
        return tr("%1 Aufgaben verschieben").arg(entries.size());
    }
    const QString title = entries.first().title;
    return title.isEmpty() ? tr("Aufgabe verschieben") : title;
}

bool TaskListView::acceptTaskMime(const QMimeData *mime) const
{
    return mime && mime->hasFormat(TaskMimeType);
}

QList<QUuid> TaskListView::decodeTaskIds(const QMimeData *mime) const
{
    QList<QUuid> ids;
    if (!acceptTaskMime(mime)) {
        return ids;
    }
    const auto entries = decodeTaskMime(mime->data(TaskMimeType));
    for (const auto &entry : entries) {
        ids << entry.id;
    }
    return ids;
}

void TaskListView::showDropLabel(const QString &text)
{
    if (m_dropHighlight && m_dropLabel == text) {
        return;
    }
    m_dropHighlight = true;
    m_dropLabel = text;
    if (viewport()) {
        viewport()->update();
    } else {
        update();
    }
}

void TaskListView::clearDropLabel()
{
    if (!m_dropHighlight) {
        return;
    }
    m_dropHighlight = false;
    m_dropLabel.clear();
    if (viewport()) {
        viewport()->update();
    } else {
        update();
    }
}

} // namespace ui
} // namespace planner
