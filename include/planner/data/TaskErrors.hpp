#pragma once

#include <QString>
#include <stdexcept>

namespace planner {
namespace data {

class TaskError : public std::runtime_error
{
public:
    explicit TaskError(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }
};

// Bad input shape: empty title, invalid tag, duplicate id on replace.
class ValidationError : public TaskError
{
public:
    using TaskError::TaskError;
};

class NotFoundError : public TaskError
{
public:
    using TaskError::TaskError;
};

// Input that cannot be read as text at all.
class FormatError : public TaskError
{
public:
    using TaskError::TaskError;
};

} // namespace data
} // namespace planner
