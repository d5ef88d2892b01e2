#pragma once

#include <QByteArray>
#include <QString>
#include <memory>
#include <optional>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {

class TaskStore;
class MarkdownFileStorage;

enum class ImportMode
{
    Replace,
    Append,
};

struct ImportResult
{
    int added = 0;
    int skipped = 0; // checklist items without a title
};

class DataProvider
{
public:
    explicit DataProvider(QString workspaceFile);
    ~DataProvider();

    TaskStore &taskStore();
    QString workspaceFile() const;
    bool hasWorkspaceFile() const;

    bool load();
    bool save() const;

    // nullopt if the source could not be read or decoded; the store is then
    // unchanged.
    std::optional<ImportResult> importFrom(const QString &filePath, ImportMode mode);
    std::optional<ImportResult> importText(const QString &text, ImportMode mode);
    bool exportTo(const QString &filePath) const;

    void seedDemoData();

private:
    std::optional<ImportResult> importBytes(const QByteArray &bytes, ImportMode mode, const QString &origin);
    ImportResult applyImport(std::vector<Task> tasks, int skipped, ImportMode mode);

    std::unique_ptr<TaskStore> m_taskStore;
    std::unique_ptr<MarkdownFileStorage> m_storage;
};

} // namespace data
} // namespace planner
