#include "core/fs/fingerprint.h"
#include "core/shared/logging.h"

#include <QCryptographicHash>
#include <QFile>

namespace rw {

std::optional<QString> computeFileFingerprint(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_DEBUG(rwFs, "Fingerprint: cannot open %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&file)) {
        LOG_WARN(rwFs, "Fingerprint: read failed for %s", qUtf8Printable(filePath));
        return std::nullopt;
    }
    return QString::fromLatin1(hash.result().toHex());
}

} // namespace rw
