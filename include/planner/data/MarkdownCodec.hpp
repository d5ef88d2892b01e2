#pragma once

#include <QByteArray>
#include <QDate>
#include <QString>
#include <QStringList>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {

// Title, tags and due date of a single checklist entry.
struct TaskEntry
{
    QString title;
    QStringList tags;
    QDate dueDate;
};

/**
 * Converts task snapshots to and from the Markdown checklist format:
 *
 *     # Tasks
 *
 *     ## Do First
 *
 *     - [ ] Prepare release notes (due: 2024-03-01) #work
 *     - [x] Book venue
 *       - Description: Main hall, 80 seats
 *
 * One section per quadrant in fixed order. encode() is deterministic,
 * decode() never rejects odd content. decodeUtf8() only throws FormatError for bytes
 * that are not UTF-8 text.
 */
class MarkdownCodec
{
public:
    static QString encode(const std::vector<Task> &tasks);
    // skipped, if given, receives the number of checklist items dropped for
    // lack of a title.
    static std::vector<Task> decode(const QString &text, int *skipped = nullptr);
    static std::vector<Task> decodeUtf8(const QByteArray &bytes, int *skipped = nullptr);

    // Parses "title (due: YYYY-MM-DD) #tag #tag". Malformed dates are dropped.
    static TaskEntry parseEntry(const QString &text);
    static QString formatEntry(const Task &task);

private:
    static QString escapeTitle(const QString &title);
    static QString unescapeTitle(const QString &title);
    static QStringList splitTagList(const QString &value);
    static QDate parseDate(const QString &value);
};

} // namespace data
} // namespace planner
