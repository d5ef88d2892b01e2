#include "planner/data/MarkdownCodec.hpp"

#include <QRegularExpression>
#include <QTextCodec>
#include <algorithm>
#include <iterator>
#include <optional>

#include "planner/core/Logging.hpp"
#include "planner/data/QuadrantClassifier.hpp"
#include "planner/data/TaskErrors.hpp"
#include "planner/data/TaskStore.hpp"

namespace planner {
namespace data {

namespace {
constexpr auto DOCUMENT_TITLE = "# Tasks";
constexpr auto OPEN_ITEM = "- [ ] ";
constexpr auto DONE_ITEM = "- [x] ";
constexpr auto DESCRIPTION_DETAIL = "  - Description: ";

const QRegularExpression &headingPattern()
{
    static const QRegularExpression pattern(QStringLiteral("^ {0,3}(#{1,6})[ \\t]+(.*?)[ \\t#]*$"));
    return pattern;
}

const QRegularExpression &checklistPattern()
{
    static const QRegularExpression pattern(
        QStringLiteral("^[ \\t]*[-*+][ \\t]+\\[([ xX\\x{2713}\\x{25A1}])\\](?:[ \\t]+(.*))?$"));
    return pattern;
}

// Indented "- Key: value" line below an item, as written by the legacy export.
const QRegularExpression &detailPattern()
{
    static const QRegularExpression pattern(
        QStringLiteral("^[ \\t]+[-*+][ \\t]+([^:\\x{FF1A}]+)[:\\x{FF1A}][ \\t]*(.*)$"));
    return pattern;
}

const QRegularExpression &dueSuffixPattern()
{
    static const QRegularExpression pattern(QStringLiteral("(^|[^\\\\])\\(due:[ \\t]*([^()]*)\\)$"),
                                            QRegularExpression::CaseInsensitiveOption);
    return pattern;
}

bool isCompletedMark(const QString &mark)
{
    return mark == QLatin1String("x") || mark == QLatin1String("X") || mark == QString(QChar(0x2713));
}

bool isTagToken(const QString &token)
{
    return token.size() > 1 && token.startsWith(QLatin1Char('#')) && TaskStore::isValidTag(token.mid(1));
}

// QChar::isSpace also covers no-break and ideographic spaces.
int lastSpaceIndex(const QString &text)
{
    for (int i = text.size() - 1; i >= 0; --i) {
        if (text.at(i).isSpace()) {
            return i;
        }
    }
    return -1;
}

bool isEscapable(QChar ch)
{
    return ch == QLatin1Char('\\') || ch == QLatin1Char('#') || ch == QLatin1Char('(');
}

// Moves trailing "#tag" tokens from text into tags, keeping their order.
void takeTrailingTags(QString &text, QStringList &tags)
{
    text = text.trimmed();
    while (true) {
        const int split = lastSpaceIndex(text);
        if (split < 0) {
            break;
        }
        const QString token = text.mid(split + 1);
        if (!isTagToken(token)) {
            break;
        }
        tags.prepend(token.mid(1));
        text = text.left(split).trimmed();
    }
}

bool isLegacyKey(const QString &key, const char *english, const char *legacy)
{
    return key.compare(QLatin1String(english), Qt::CaseInsensitive) == 0 || key == QString::fromUtf8(legacy);
}
} // namespace

QString MarkdownCodec::encode(const std::vector<Task> &tasks)
{
    QStringList lines;
    lines << QString::fromLatin1(DOCUMENT_TITLE);

    for (const Quadrant quadrant : allQuadrants()) {
        std::vector<Task> section;
        std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(section), [quadrant](const Task &task) {
            return quadrantOf(task) == quadrant;
        });
        std::sort(section.begin(), section.end(), taskListingLess);

        lines << QString() << QStringLiteral("## %1").arg(quadrantHeading(quadrant));
        if (!section.empty()) {
            lines << QString();
        }
        for (const Task &task : section) {
            lines << QString::fromLatin1(task.completed ? DONE_ITEM : OPEN_ITEM) + formatEntry(task);
            if (!task.description.isEmpty()) {
                lines << QString::fromLatin1(DESCRIPTION_DETAIL) + task.description;
            }
        }
    }

    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

std::vector<Task> MarkdownCodec::decode(const QString &text, int *skipped)
{
    std::vector<Task> tasks;
    QString normalized = text;
    normalized.remove(QLatin1Char('\r'));
    const QStringList lines = normalized.split(QLatin1Char('\n'));

    const QDateTime importTime = QDateTime::currentDateTime();
    std::optional<Quadrant> currentQuadrant;
    int lastIndex = -1;
    int skippedItems = 0;

    for (const QString &line : lines) {
        const auto heading = headingPattern().match(line);
        if (heading.hasMatch()) {
            currentQuadrant = quadrantFromHeading(heading.captured(2));
            lastIndex = -1;
            continue;
        }

        const auto item = checklistPattern().match(line);
        if (item.hasMatch()) {
            const TaskEntry entry = parseEntry(item.captured(2));
            if (entry.title.isEmpty()) {
                ++skippedItems;
                lastIndex = -1;
                continue;
            }
            const Quadrant quadrant = currentQuadrant.value_or(Quadrant::Eliminate);
            Task task;
            task.title = entry.title;
            task.urgent = urgentFor(quadrant);
            task.important = importantFor(quadrant);
            task.tags = entry.tags;
            task.dueDate = entry.dueDate;
            task.completed = isCompletedMark(item.captured(1));
            task.createdAt = importTime.addMSecs(static_cast<qint64>(tasks.size()));
            tasks.push_back(std::move(task));
            lastIndex = static_cast<int>(tasks.size()) - 1;
            continue;
        }

        if (lastIndex < 0) {
            continue;
        }
        const auto detail = detailPattern().match(line);
        if (!detail.hasMatch()) {
            continue;
        }
        Task &owner = tasks[static_cast<size_t>(lastIndex)];
        const QString key = detail.captured(1).trimmed();
        const QString value = detail.captured(2).trimmed();
        if (isLegacyKey(key, "due", "截止")) {
            const QDate dueDate = parseDate(value);
            if (dueDate.isValid()) {
                owner.dueDate = dueDate;
            } else {
                qCDebug(lcPlannerCodec) << "Ignoring malformed due date" << value;
            }
        } else if (isLegacyKey(key, "description", "描述")) {
            owner.description = value;
        } else if (isLegacyKey(key, "tags", "标签")) {
            for (const QString &tag : splitTagList(value)) {
                if (!owner.tags.contains(tag)) {
                    owner.tags << tag;
                }
            }
        }
    }

    if (skippedItems > 0) {
        qCDebug(lcPlannerCodec) << "Skipped" << skippedItems << "checklist items without a title";
    }
    if (skipped) {
        *skipped = skippedItems;
    }
    qCDebug(lcPlannerCodec) << "Decoded" << tasks.size() << "tasks from" << lines.size() << "lines";
    return tasks;
}

std::vector<Task> MarkdownCodec::decodeUtf8(const QByteArray &bytes, int *skipped)
{
    if (bytes.contains('\0')) {
        throw FormatError(QStringLiteral("Input contains binary data"));
    }
    QByteArray payload = bytes;
    if (payload.startsWith("\xEF\xBB\xBF")) {
        payload.remove(0, 3);
    }

    QTextCodec *codec = QTextCodec::codecForName("UTF-8");
    QTextCodec::ConverterState state;
    const QString text = codec->toUnicode(payload.constData(), payload.size(), &state);
    if (state.invalidChars > 0) {
        throw FormatError(QStringLiteral("Input is not valid UTF-8 text"));
    }
    return decode(text, skipped);
}

TaskEntry MarkdownCodec::parseEntry(const QString &text)
{
    TaskEntry entry;
    QString remaining = text;
    takeTrailingTags(remaining, entry.tags);

    const auto due = dueSuffixPattern().match(remaining);
    if (due.hasMatch()) {
        entry.dueDate = parseDate(due.captured(2));
        if (!entry.dueDate.isValid()) {
            qCDebug(lcPlannerCodec) << "Dropping malformed due date" << due.captured(2);
        }
        remaining = remaining.left(due.capturedStart(0) + due.capturedLength(1));

        QStringList leadingTags;
        takeTrailingTags(remaining, leadingTags);
        entry.tags = leadingTags + entry.tags;
    }

    entry.title = unescapeTitle(remaining).trimmed();
    return entry;
}

QString MarkdownCodec::formatEntry(const Task &task)
{
    QString line = escapeTitle(task.title);
    if (task.dueDate.isValid()) {
        line += QStringLiteral(" (due: %1)").arg(task.dueDate.toString(Qt::ISODate));
    }
    QStringList tags = task.tags;
    tags.sort();
    for (const QString &tag : tags) {
        line += QStringLiteral(" #%1").arg(tag);
    }
    return line;
}

QString MarkdownCodec::escapeTitle(const QString &title)
{
    QString escaped;
    escaped.reserve(title.size() + 8);
    for (int i = 0; i < title.size(); ++i) {
        const QChar ch = title.at(i);
        const QChar next = i + 1 < title.size() ? title.at(i + 1) : QChar();
        if (ch == QLatin1Char('\\') && isEscapable(next)) {
            escaped += QLatin1String("\\\\");
        } else if (ch == QLatin1Char('#') && (i == 0 || title.at(i - 1).isSpace())) {
            escaped += QLatin1String("\\#");
        } else if (ch == QLatin1Char('(')
                   && title.midRef(i + 1).startsWith(QLatin1String("due:"), Qt::CaseInsensitive)) {
            escaped += QLatin1String("\\(");
        } else {
            escaped += ch;
        }
    }
    return escaped;
}

QString MarkdownCodec::unescapeTitle(const QString &title)
{
    QString plain;
    plain.reserve(title.size());
    for (int i = 0; i < title.size(); ++i) {
        const QChar ch = title.at(i);
        if (ch == QLatin1Char('\\') && i + 1 < title.size() && isEscapable(title.at(i + 1))) {
            plain += title.at(i + 1);
            ++i;
            continue;
        }
        plain += ch;
    }
    return plain;
}

QStringList MarkdownCodec::splitTagList(const QString &value)
{
    static const QRegularExpression separators(QStringLiteral("[,\\x{FF0C}\\s]+"),
                                               QRegularExpression::UseUnicodePropertiesOption);
    QStringList tags;
    for (QString tag : value.split(separators, Qt::SkipEmptyParts)) {
        if (tag.startsWith(QLatin1Char('#'))) {
            tag.remove(0, 1);
        }
        if (!TaskStore::isValidTag(tag)) {
            continue;
        }
        tags << tag;
    }
    return tags;
}

QDate MarkdownCodec::parseDate(const QString &value)
{
    return QDate::fromString(value.trimmed(), Qt::ISODate);
}

} // namespace data
} // namespace planner
