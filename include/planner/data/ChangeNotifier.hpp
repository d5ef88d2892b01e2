#pragma once

#include <QUuid>
#include <QtGlobal>
#include <functional>
#include <vector>

namespace planner {
namespace data {

struct ChangeEvent
{
    enum class Kind
    {
        Added,
        Updated,
        Removed,
        Reset,
    };

    Kind kind = Kind::Reset;
    QUuid id; // null for Reset
};

using SubscriptionToken = quint64;

/**
 * Ordered list of change handlers owned by a TaskStore.
 *
 * Handlers run synchronously in registration order. An exception thrown by
 * one handler is logged and does not stop the remaining handlers.
 */
class ChangeNotifier
{
public:
    using Handler = std::function<void(const ChangeEvent &)>;

    ChangeNotifier();
    ~ChangeNotifier();

    ChangeNotifier(const ChangeNotifier &) = delete;
    ChangeNotifier &operator=(const ChangeNotifier &) = delete;

    SubscriptionToken subscribe(Handler handler);
    void unsubscribe(SubscriptionToken token);
    void notify(const ChangeEvent &event) const;

    std::size_t subscriberCount() const;

private:
    struct Subscription
    {
        SubscriptionToken token = 0;
        Handler handler;
    };

    bool isSubscribed(SubscriptionToken token) const;

    std::vector<Subscription> m_subscriptions;
    SubscriptionToken m_nextToken = 1;
};

} // namespace data
} // namespace planner
