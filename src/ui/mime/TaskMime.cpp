#include "planner/ui/mime/TaskMime.hpp"

#include <QDataStream>

namespace planner {
namespace ui {

namespace {
constexpr quint32 CurrentTaskMimeVersion = 1;
} // namespace

QByteArray encodeTaskMime(const QList<TaskMimeEntry> &entries)
{
    QByteArray buffer;
    QDataStream stream(&buffer, QIODevice::WriteOnly);
    stream << TaskMimeMagic << CurrentTaskMimeVersion << quint32(entries.size());
    for (const auto &entry : entries) {
        stream << entry.id << entry.title;
    }
    return buffer;
}

QVector<TaskMimeEntry> decodeTaskMime(const QByteArray &payload)
{
    QVector<TaskMimeEntry> entries;
    if (payload.isEmpty()) {
        return entries;
    }
    QDataStream stream(payload);

    quint32 magic = 0;
    quint32 version = 0;
    quint32 count = 0;
    stream >> magic >> version >> count;
    if (magic != TaskMimeMagic || version > CurrentTaskMimeVersion) {
        return entries;
    }
    for (quint32 i = 0; i < count && !stream.atEnd(); ++i) {
        TaskMimeEntry entry;
        stream >> entry.id >> entry.title;
        if (stream.status() != QDataStream::Ok) {
            break;
        }
        if (!entry.id.isNull()) {
            entries.append(entry);
        }
    }
    return entries;
}

} // namespace ui
} // namespace planner
