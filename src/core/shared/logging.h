#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(rwCore)
Q_DECLARE_LOGGING_CATEGORY(rwIndex)
Q_DECLARE_LOGGING_CATEGORY(rwExtraction)
Q_DECLARE_LOGGING_CATEGORY(rwFs)
Q_DECLARE_LOGGING_CATEGORY(rwStore)
Q_DECLARE_LOGGING_CATEGORY(rwModels)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
