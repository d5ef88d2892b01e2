#include "planner/data/ChangeNotifier.hpp"

#include <algorithm>
#include <exception>

#include "planner/core/Logging.hpp"

namespace planner {
namespace data {

ChangeNotifier::ChangeNotifier() = default;
ChangeNotifier::~ChangeNotifier() = default;

SubscriptionToken ChangeNotifier::subscribe(Handler handler)
{
    const SubscriptionToken token = m_nextToken++;
    m_subscriptions.push_back({ token, std::move(handler) });
    return token;
}

void ChangeNotifier::unsubscribe(SubscriptionToken token)
{
    m_subscriptions.erase(std::remove_if(m_subscriptions.begin(),
                                         m_subscriptions.end(),
                                         [token](const Subscription &entry) {
                                             return entry.token == token;
                                         }),
                          m_subscriptions.end());
}

void ChangeNotifier::notify(const ChangeEvent &event) const
{
    // Handlers may subscribe or unsubscribe while we dispatch.
    const auto subscriptions = m_subscriptions;
    for (const auto &entry : subscriptions) {
        if (!entry.handler || !isSubscribed(entry.token)) {
            continue;
        }
        try {
            entry.handler(event);
        } catch (const std::exception &error) {
            qCWarning(lcPlannerStore) << "Change handler" << entry.token << "failed:" << error.what();
        } catch (...) {
            qCWarning(lcPlannerStore) << "Change handler" << entry.token << "failed with an unknown exception";
        }
    }
}

std::size_t ChangeNotifier::subscriberCount() const
{
    return m_subscriptions.size();
}

bool ChangeNotifier::isSubscribed(SubscriptionToken token) const
{
    return std::any_of(m_subscriptions.begin(), m_subscriptions.end(), [token](const Subscription &entry) {
        return entry.token == token;
    });
}

} // namespace data
} // namespace planner
