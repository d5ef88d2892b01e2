#include "planner/data/DataProvider.hpp"

#include <QDate>
#include <QObject>
#include <iterator>

#include "planner/core/Logging.hpp"
#include "planner/data/MarkdownCodec.hpp"
#include "planner/data/MarkdownFileStorage.hpp"
#include "planner/data/TaskErrors.hpp"
#include "planner/data/TaskStore.hpp"

namespace planner {
namespace data {

DataProvider::DataProvider(QString workspaceFile)
    : m_taskStore(std::make_unique<TaskStore>())
    , m_storage(std::make_unique<MarkdownFileStorage>(std::move(workspaceFile)))
{
}

DataProvider::~DataProvider() = default;

TaskStore &DataProvider::taskStore()
{
    return *m_taskStore;
}

QString DataProvider::workspaceFile() const
{
    return m_storage->filePath();
}

bool DataProvider::hasWorkspaceFile() const
{
    return m_storage->exists();
}

bool DataProvider::load()
{
    if (!m_storage->exists()) {
        return true;
    }
    const auto bytes = m_storage->read();
    if (!bytes) {
        return false;
    }
    const auto imported = importBytes(*bytes, ImportMode::Replace, m_storage->filePath());
    if (!imported) {
        return false;
    }
    qCInfo(lcPlannerStorage) << "Loaded" << imported->added << "tasks from" << m_storage->filePath();
    return true;
}

bool DataProvider::save() const
{
    const bool ok = m_storage->write(MarkdownCodec::encode(m_taskStore->snapshot()));
    if (ok) {
        qCInfo(lcPlannerStorage) << "Saved" << m_taskStore->size() << "tasks to" << m_storage->filePath();
    }
    return ok;
}

std::optional<ImportResult> DataProvider::importFrom(const QString &filePath, ImportMode mode)
{
    const MarkdownFileStorage source(filePath);
    const auto bytes = source.read();
    if (!bytes) {
        return std::nullopt;
    }
    const auto imported = importBytes(*bytes, mode, filePath);
    if (imported) {
        qCInfo(lcPlannerStorage) << "Imported" << imported->added << "tasks from" << filePath << "skipped"
                                 << imported->skipped;
    }
    return imported;
}

std::optional<ImportResult> DataProvider::importText(const QString &text, ImportMode mode)
{
    try {
        int skipped = 0;
        auto tasks = MarkdownCodec::decode(text, &skipped);
        return applyImport(std::move(tasks), skipped, mode);
    } catch (const TaskError &error) {
        qCWarning(lcPlannerStorage) << "Cannot import pasted text:" << error.what();
        return std::nullopt;
    }
}

bool DataProvider::exportTo(const QString &filePath) const
{
    const MarkdownFileStorage target(filePath);
    const bool ok = target.write(MarkdownCodec::encode(m_taskStore->snapshot()));
    if (ok) {
        qCInfo(lcPlannerStorage) << "Exported" << m_taskStore->size() << "tasks to" << filePath;
    }
    return ok;
}

void DataProvider::seedDemoData()
{
    if (!m_taskStore->isEmpty()) {
        return;
    }
    const QDate today = QDate::currentDate();
    m_taskStore->add(QObject::tr("Quartalsbericht abschließen"), true, true, { QStringLiteral("arbeit") }, today.addDays(2));
    m_taskStore->add(QObject::tr("Lernplan für Qt aufstellen"),
                     false,
                     true,
                     { QStringLiteral("lernen") },
                     {},
                     QObject::tr("Model/View, Signale und Slots, QtTest"));
    m_taskStore->add(QObject::tr("E-Mails beantworten"), true, false, {}, today.addDays(1));
}

std::optional<ImportResult> DataProvider::importBytes(const QByteArray &bytes, ImportMode mode, const QString &origin)
{
    try {
        int skipped = 0;
        auto tasks = MarkdownCodec::decodeUtf8(bytes, &skipped);
        return applyImport(std::move(tasks), skipped, mode);
    } catch (const TaskError &error) {
        qCWarning(lcPlannerStorage) << "Cannot import" << origin << ":" << error.what();
        return std::nullopt;
    }
}

ImportResult DataProvider::applyImport(std::vector<Task> tasks, int skipped, ImportMode mode)
{
    ImportResult result;
    result.added = static_cast<int>(tasks.size());
    result.skipped = skipped;
    if (mode == ImportMode::Append) {
        auto combined = m_taskStore->snapshot();
        combined.insert(combined.end(),
                        std::make_move_iterator(tasks.begin()),
                        std::make_move_iterator(tasks.end()));
        m_taskStore->replace(std::move(combined));
    } else {
        m_taskStore->replace(std::move(tasks));
    }
    return result;
}

} // namespace data
} // namespace planner
