#include "test_fs_utils.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringList>

namespace rw::test {

bool writeFile(const QString& path, const QByteArray& payload)
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return false;
    }
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    if (file.write(payload) != payload.size()) {
        return false;
    }
    file.close();
    return true;
}

bool writeTextFile(const QString& path, const QString& text)
{
    return writeFile(path, text.toUtf8());
}

QString numberedWords(int count, const QString& prefix)
{
    QStringList words;
    words.reserve(count);
    for (int i = 0; i < count; ++i) {
        words.append(prefix + QString::number(i));
    }
    return words.join(QLatin1Char(' '));
}

} // namespace rw::test
