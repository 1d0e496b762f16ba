#pragma once

#include <QString>
#include <optional>

namespace rw {

// SHA-256 of the file bytes, hex encoded. Returns nullopt when the file
// cannot be opened or read to the end.
std::optional<QString> computeFileFingerprint(const QString& filePath);

} // namespace rw
