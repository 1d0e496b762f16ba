#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(rwCore, "ragwatch.core")
Q_LOGGING_CATEGORY(rwIndex, "ragwatch.index")
Q_LOGGING_CATEGORY(rwExtraction, "ragwatch.extraction")
Q_LOGGING_CATEGORY(rwFs, "ragwatch.fs")
Q_LOGGING_CATEGORY(rwStore, "ragwatch.store")
Q_LOGGING_CATEGORY(rwModels, "ragwatch.models")
