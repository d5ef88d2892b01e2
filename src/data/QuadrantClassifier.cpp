#include "planner/data/QuadrantClassifier.hpp"

#include <QRegularExpression>

namespace planner {
namespace data {

namespace {
struct HeadingAlias
{
    const char *text;
    Quadrant quadrant;
};

// Lower-case, whitespace-free spellings. Includes the section names of the
// legacy Chinese export.
constexpr HeadingAlias HEADING_ALIASES[] = {
    { "dofirst", Quadrant::DoFirst },
    { "urgent&important", Quadrant::DoFirst },
    { "important&urgent", Quadrant::DoFirst },
    { "重要紧急", Quadrant::DoFirst },
    { "重要且紧急", Quadrant::DoFirst },
    { "schedule", Quadrant::Schedule },
    { "important&noturgent", Quadrant::Schedule },
    { "重要不紧急", Quadrant::Schedule },
    { "delegate", Quadrant::Delegate },
    { "urgent&notimportant", Quadrant::Delegate },
    { "不重要紧急", Quadrant::Delegate },
    { "紧急不重要", Quadrant::Delegate },
    { "eliminate", Quadrant::Eliminate },
    { "noturgent&notimportant", Quadrant::Eliminate },
    { "不重要不紧急", Quadrant::Eliminate },
};
} // namespace

const std::array<Quadrant, 4> &allQuadrants()
{
    static const std::array<Quadrant, 4> quadrants = {
        Quadrant::DoFirst,
        Quadrant::Schedule,
        Quadrant::Delegate,
        Quadrant::Eliminate,
    };
    return quadrants;
}

QString quadrantHeading(Quadrant quadrant)
{
    switch (quadrant) {
    case Quadrant::DoFirst:
        return QStringLiteral("Do First");
    case Quadrant::Schedule:
        return QStringLiteral("Schedule");
    case Quadrant::Delegate:
        return QStringLiteral("Delegate");
    case Quadrant::Eliminate:
    default:
        return QStringLiteral("Eliminate");
    }
}

std::optional<Quadrant> quadrantFromHeading(const QString &heading)
{
    static const QRegularExpression countSuffix(QStringLiteral("\\s*[(（][^)）]*[)）]\\s*$"));
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));

    QString normalized = heading.trimmed();
    normalized.remove(countSuffix);
    normalized.remove(whitespace);
    normalized.replace(QStringLiteral("and"), QStringLiteral("&"), Qt::CaseInsensitive);
    normalized = normalized.toLower();
    if (normalized.isEmpty()) {
        return std::nullopt;
    }
    for (const auto &alias : HEADING_ALIASES) {
        if (normalized == QString::fromUtf8(alias.text)) {
            return alias.quadrant;
        }
    }
    return std::nullopt;
}

} // namespace data
} // namespace planner
