#pragma once

#include <memory>

namespace planner {
namespace data {
class DataProvider;
class TaskStore;
}

namespace core {

class AppSettings;

class AppContext
{
public:
    AppContext();
    explicit AppContext(std::unique_ptr<AppSettings> settings);
    ~AppContext();

    data::TaskStore &taskStore();
    data::DataProvider &dataProvider();
    AppSettings &settings();

    // Writes the workspace file if saving on exit is enabled.
    bool shutdown();

private:
    std::unique_ptr<AppSettings> m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    bool m_workspaceLoaded = true;
};

} // namespace core
} // namespace planner
