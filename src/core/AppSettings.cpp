#include "planner/core/AppSettings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace planner {
namespace core {

namespace {
const QString WorkspaceFileKey = QStringLiteral("storage/workspaceFile");
const QString ExportDirectoryKey = QStringLiteral("storage/lastExportDirectory");
const QString SaveOnExitKey = QStringLiteral("storage/saveOnExit");
const QString HideCompletedKey = QStringLiteral("ui/hideCompleted");
} // namespace

AppSettings::AppSettings()
    : m_settings(std::make_unique<QSettings>())
{
}

AppSettings::AppSettings(const QString &iniFile)
    : m_settings(std::make_unique<QSettings>(iniFile, QSettings::IniFormat))
{
}

AppSettings::~AppSettings() = default;

QString AppSettings::workspaceFile() const
{
    const QString stored = m_settings->value(WorkspaceFileKey).toString();
    if (stored.isEmpty()) {
        return defaultWorkspaceFile();
    }
    return stored;
}

void AppSettings::setWorkspaceFile(const QString &filePath)
{
    m_settings->setValue(WorkspaceFileKey, filePath);
}

QString AppSettings::lastExportDirectory() const
{
    const QString stored = m_settings->value(ExportDirectoryKey).toString();
    if (!stored.isEmpty() && QDir(stored).exists()) {
        return stored;
    }
    const QString documents = QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation);
    return documents.isEmpty() ? QDir::homePath() : documents;
}

void AppSettings::setLastExportDirectory(const QString &directory)
{
    m_settings->setValue(ExportDirectoryKey, directory);
}

bool AppSettings::saveOnExit() const
{
    return m_settings->value(SaveOnExitKey, true).toBool();
}

void AppSettings::setSaveOnExit(bool enabled)
{
    m_settings->setValue(SaveOnExitKey, enabled);
}

bool AppSettings::hideCompleted() const
{
    return m_settings->value(HideCompletedKey, false).toBool();
}

void AppSettings::setHideCompleted(bool hide)
{
    m_settings->setValue(HideCompletedKey, hide);
}

QString AppSettings::defaultWorkspaceFile()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/quadrant-planner");
    }
    return QDir(storageFolder).filePath(QStringLiteral("tasks.md"));
}

} // namespace core
} // namespace planner
