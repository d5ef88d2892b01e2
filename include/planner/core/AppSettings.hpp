#pragma once

#include <QString>
#include <memory>

class QSettings;

namespace planner {
namespace core {

class AppSettings
{
public:
    AppSettings();
    explicit AppSettings(const QString &iniFile);
    ~AppSettings();

    QString workspaceFile() const;
    void setWorkspaceFile(const QString &filePath);

    QString lastExportDirectory() const;
    void setLastExportDirectory(const QString &directory);

    bool saveOnExit() const;
    void setSaveOnExit(bool enabled);

    bool hideCompleted() const;
    void setHideCompleted(bool hide);

    static QString defaultWorkspaceFile();

private:
    std::unique_ptr<QSettings> m_settings;
};

} // namespace core
} // namespace planner
