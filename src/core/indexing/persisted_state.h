#pragma once

#include "core/shared/types.h"

#include <QByteArray>
#include <QString>

#include <optional>
#include <vector>

namespace rw {

// One watched folder as written to PersistedState.
struct PersistedFolder {
    WatchedFolder folder;
    // True when the folder was Watching with no backlog at write time;
    // restore() skips the rescan for clean folders.
    bool clean = false;
};

// PersistedState - the only durable cross-restart state of the engine.
//
// Serialized as a versioned JSON document and stored in the vector store's
// metadata records under kRecordId. Documents with an unknown schema
// version are rejected.
class PersistedState {
public:
    static constexpr int kSchemaVersion = 1;
    static constexpr const char* kRecordId = "f0f0f0f0-0000-0000-0000-000000000001";

    std::vector<PersistedFolder> folders;

    QByteArray serialize() const;
    static std::optional<PersistedState> deserialize(const QByteArray& data,
                                                     QString* error = nullptr);
};

} // namespace rw
