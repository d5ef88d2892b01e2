#pragma once

#include <QListView>
#include <QList>
#include <QUuid>

#include "planner/data/QuadrantClassifier.hpp"

class QMimeData;

namespace planner {
namespace ui {

class TaskListView : public QListView
{
    Q_OBJECT

public:
    explicit TaskListView(QWidget *parent = nullptr);

    void setTargetQuadrant(data::Quadrant quadrant);
    data::Quadrant targetQuadrant() const;

    // Text shown over the view while task entries are dragged onto it.
    static QString dropLabel(const QMimeData *mime);

signals:
    void tasksDropped(const QList<QUuid> &taskIds, data::Quadrant quadrant);

protected:
    void dragEnterEvent(QDragEnterEvent *event) override;
    void dragMoveEvent(QDragMoveEvent *event) override;
    void dragLeaveEvent(QDragLeaveEvent *event) override;
    void dropEvent(QDropEvent *event) override;
    void paintEvent(QPaintEvent *event) override;

private:
    bool acceptTaskMime(const QMimeData *mime) const;
    QList<QUuid> decodeTaskIds(const QMimeData *mime) const;
    void showDropLabel(const QString &text);
    void clearDropLabel();

    data::Quadrant m_targetQuadrant = data::Quadrant::Eliminate;
    bool m_dropHighlight = false;
    QString m_dropLabel;
};

} // namespace ui
} // namespace planner
