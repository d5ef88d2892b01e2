#include "planner/data/MarkdownFileStorage.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "planner/core/Logging.hpp"

namespace planner {
namespace data {

MarkdownFileStorage::MarkdownFileStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &MarkdownFileStorage::filePath() const
{
    return m_filePath;
}

bool MarkdownFileStorage::exists() const
{
    return !m_filePath.isEmpty() && QFileInfo::exists(m_filePath);
}

std::optional<QByteArray> MarkdownFileStorage::read() const
{
    QFile file(m_filePath);
    if (!file.exists()) {
        qCInfo(lcPlannerStorage) << "No task file at" << m_filePath;
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcPlannerStorage) << "Cannot open" << m_filePath << "for reading:" << file.errorString();
        return std::nullopt;
    }
    return file.readAll();
}

bool MarkdownFileStorage::write(const QString &text) const
{
    if (m_filePath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcPlannerStorage) << "Cannot create directory" << dir.path();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcPlannerStorage) << "Cannot open" << m_filePath << "for writing:" << file.errorString();
        return false;
    }
    const QByteArray payload = text.toUtf8();
    if (file.write(payload) != payload.size()) {
        qCWarning(lcPlannerStorage) << "Short write to" << m_filePath << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qCWarning(lcPlannerStorage) << "Cannot commit" << m_filePath << ":" << file.errorString();
        return false;
    }
    return true;
}

} // namespace data
} // namespace planner
