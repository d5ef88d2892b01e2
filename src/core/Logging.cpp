#include "planner/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcPlannerStore, "planner.store")
Q_LOGGING_CATEGORY(lcPlannerCodec, "planner.codec")
Q_LOGGING_CATEGORY(lcPlannerStorage, "planner.storage")
Q_LOGGING_CATEGORY(lcPlannerUi, "planner.ui")
