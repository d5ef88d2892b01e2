#include "planner/core/AppContext.hpp"

#include "planner/core/AppSettings.hpp"
#include "planner/core/Logging.hpp"
#include "planner/data/DataProvider.hpp"

namespace planner {
namespace core {

AppContext::AppContext()
    : AppContext(std::make_unique<AppSettings>())
{
}

AppContext::AppContext(std::unique_ptr<AppSettings> settings)
    : m_settings(std::move(settings))
    , m_dataProvider(std::make_unique<data::DataProvider>(m_settings->workspaceFile()))
{
    if (!m_dataProvider->hasWorkspaceFile()) {
        m_dataProvider->seedDemoData();
    } else if (!m_dataProvider->load()) {
        m_workspaceLoaded = false;
        qCWarning(lcPlannerStorage) << "Starting with an empty task list, workspace file unreadable:"
                                    << m_dataProvider->workspaceFile();
    }
}

AppContext::~AppContext() = default;

data::TaskStore &AppContext::taskStore()
{
    return m_dataProvider->taskStore();
}

data::DataProvider &AppContext::dataProvider()
{
    return *m_dataProvider;
}

AppSettings &AppContext::settings()
{
    return *m_settings;
}

bool AppContext::shutdown()
{
    if (!m_settings->saveOnExit()) {
        return true;
    }
    if (!m_workspaceLoaded) {
        // The unreadable workspace file stays untouched.
        qCWarning(lcPlannerStorage) << "Not overwriting" << m_dataProvider->workspaceFile();
        return false;
    }
    return m_dataProvider->save();
}

} // namespace core
} // namespace planner
