#pragma once

#include <QByteArray>
#include <QList>
#include <QVector>
#include <QtGlobal>

#include <QString>
#include <QUuid>

namespace planner {
namespace ui {

constexpr const char *TaskMimeType = "application/x-planner-task";
constexpr quint32 TaskMimeMagic = 0x5441534B; // "TASK"

struct TaskMimeEntry
{
    QUuid id;
    QString title;
};

QByteArray encodeTaskMime(const QList<TaskMimeEntry> &entries);
QVector<TaskMimeEntry> decodeTaskMime(const QByteArray &payload);

} // namespace ui
} // namespace planner
