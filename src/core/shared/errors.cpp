#include "core/shared/errors.h"

namespace rw {

bool SyncError::isTransient() const
{
    return code == Code::IndexStore || code == Code::EmbeddingProvider;
}

QString syncErrorCodeToString(SyncError::Code code)
{
    switch (code) {
    case SyncError::Code::PathNotFound:      return QStringLiteral("PathNotFoundError");
    case SyncError::Code::AlreadyWatched:    return QStringLiteral("AlreadyWatchedError");
    case SyncError::Code::NotWatched:        return QStringLiteral("NotWatchedError");
    case SyncError::Code::PathConflict:      return QStringLiteral("PathConflictError");
    case SyncError::Code::InvalidArgument:   return QStringLiteral("InvalidArgumentError");
    case SyncError::Code::Extraction:        return QStringLiteral("ExtractionError");
    case SyncError::Code::IndexStore:        return QStringLiteral("IndexStoreError");
    case SyncError::Code::EmbeddingProvider: return QStringLiteral("EmbeddingProviderError");
    }
    return QStringLiteral("UnknownError");
}

SyncResult SyncResult::success()
{
    return SyncResult{};
}

SyncResult SyncResult::failure(SyncError::Code code, const QString& message)
{
    SyncResult result;
    result.error = SyncError{code, message};
    return result;
}

} // namespace rw
