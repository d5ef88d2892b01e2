#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

namespace planner {
namespace data {

class MarkdownFileStorage
{
public:
    explicit MarkdownFileStorage(QString filePath);
    ~MarkdownFileStorage() = default;

    const QString &filePath() const;
    bool exists() const;

    std::optional<QByteArray> read() const;
    bool write(const QString &text) const;

private:
    QString m_filePath;
};

} // namespace data
} // namespace planner
