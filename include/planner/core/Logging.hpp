#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcPlannerStore)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerCodec)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerStorage)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerUi)
