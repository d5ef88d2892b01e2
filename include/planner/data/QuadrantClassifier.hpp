#pragma once

#include <QString>
#include <array>
#include <optional>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {

enum class Quadrant
{
    DoFirst,
    Schedule,
    Delegate,
    Eliminate,
};

constexpr Quadrant classify(bool urgent, bool important)
{
    if (important) {
        return urgent ? Quadrant::DoFirst : Quadrant::Schedule;
    }
    return urgent ? Quadrant::Delegate : Quadrant::Eliminate;
}

inline Quadrant quadrantOf(const Task &task)
{
    return classify(task.urgent, task.important);
}

constexpr bool urgentFor(Quadrant quadrant)
{
    return quadrant == Quadrant::DoFirst || quadrant == Quadrant::Delegate;
}

constexpr bool importantFor(Quadrant quadrant)
{
    return quadrant == Quadrant::DoFirst || quadrant == Quadrant::Schedule;
}

const std::array<Quadrant, 4> &allQuadrants();

// Section title used in exported Markdown.
QString quadrantHeading(Quadrant quadrant);
std::optional<Quadrant> quadrantFromHeading(const QString &heading);

} // namespace data
} // namespace planner
