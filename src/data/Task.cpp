#include "planner/data/Task.hpp"

namespace planner {
namespace data {

bool taskListingLess(const Task &lhs, const Task &rhs)
{
    if (lhs.completed != rhs.completed) {
        return !lhs.completed;
    }
    const bool lhsHasDue = lhs.dueDate.isValid();
    const bool rhsHasDue = rhs.dueDate.isValid();
    if (lhsHasDue != rhsHasDue) {
        return lhsHasDue;
    }
    if (lhsHasDue && lhs.dueDate != rhs.dueDate) {
        return lhs.dueDate < rhs.dueDate;
    }
    if (lhs.createdAt != rhs.createdAt) {
        return lhs.createdAt < rhs.createdAt;
    }
    if (lhs.title != rhs.title) {
        return lhs.title < rhs.title;
    }
    return lhs.id < rhs.id;
}

} // namespace data
} // namespace planner
