#pragma once

#include <QString>

#include <optional>

namespace rw {

// SyncError - failure reported by the synchronization engine.
//
// PathNotFound, AlreadyWatched, NotWatched, PathConflict and InvalidArgument
// are caller errors and are never retried. Extraction is per-file and only
// counted. IndexStore and EmbeddingProvider are transient and retried with
// backoff by the task that hit them.
struct SyncError {
    enum class Code {
        PathNotFound,
        AlreadyWatched,
        NotWatched,
        PathConflict,
        InvalidArgument,
        Extraction,
        IndexStore,
        EmbeddingProvider,
    };

    Code code = Code::InvalidArgument;
    QString message;

    bool isTransient() const;
};

QString syncErrorCodeToString(SyncError::Code code);

struct SyncResult {
    std::optional<SyncError> error;

    bool ok() const { return !error.has_value(); }

    static SyncResult success();
    static SyncResult failure(SyncError::Code code, const QString& message);
};

} // namespace rw
