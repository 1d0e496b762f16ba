#include "core/shared/fragment.h"
#include <QCryptographicHash>

namespace rw {

QString computeFragmentId(const QString& path, const QString& fingerprint, int ordinal)
{
    QByteArray seed = path.toUtf8();
    seed.append('\0');
    seed.append(fingerprint.toUtf8());
    seed.append('\0');
    seed.append(QByteArray::number(ordinal));

    const QByteArray hex = QCryptographicHash::hash(seed, QCryptographicHash::Sha256)
                               .left(16)
                               .toHex();
    // 8-4-4-4-12
    return QString::fromLatin1(hex.mid(0, 8) + '-' + hex.mid(8, 4) + '-' + hex.mid(12, 4)
                               + '-' + hex.mid(16, 4) + '-' + hex.mid(20, 12));
}

} // namespace rw
