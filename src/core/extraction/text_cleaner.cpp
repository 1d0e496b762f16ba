#include "core/extraction/text_cleaner.h"

namespace rw {

QString TextCleaner::clean(const QString& raw)
{
    if (raw.isEmpty()) {
        return raw;
    }

    QString result;
    result.reserve(raw.size());

    bool pendingSpace = false;
    for (const QChar ch : raw) {
        if (ch.isSpace()) {
            pendingSpace = !result.isEmpty();
            continue;
        }

        const ushort code = ch.unicode();
        if (code < 0x20 || code == 0x7F || (code >= 0x80 && code < 0xA0)
            || ch.category() == QChar::Other_Format) {
            continue;
        }

        if (pendingSpace) {
            result.append(QLatin1Char(' '));
            pendingSpace = false;
        }
        result.append(ch);
    }

    return result;
}

} // namespace rw
