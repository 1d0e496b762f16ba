#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>
#include <vector>

namespace rw {

// Payload stored next to every fragment vector.
struct FragmentPayload {
    QString path;
    int chunkIndex = 0;
    int totalChunks = 0;
    QString contentPreview;
    QString fingerprint;
    double mtime = 0.0;
};

struct FragmentPoint {
    QString id;
    std::vector<float> vector;
    FragmentPayload payload;
};

// One stored fragment without its vector, as returned by listFragments().
struct FragmentListing {
    QString id;
    QString path;
    int chunkIndex = 0;
    QString fingerprint;
};

struct ScoredFragment {
    QString id;
    float score = 0.0f;         // cosine similarity, higher is closer
    FragmentPayload payload;
};

// VectorStore - the index the engine keeps in sync.
//
// Every operation reports failure by returning false and, when `error` is
// non-null, a human-readable reason. Failures are treated as transient by
// callers and retried. Implementations must be safe to call from several
// worker threads at once.
class VectorStore {
public:
    enum class Metric {
        Cosine,
    };

    virtual ~VectorStore() = default;

    // ── Collections ─────────────────────────────────────────

    // Creating an existing collection with the same dimensions succeeds.
    virtual bool createCollection(const QString& name, int dimensions, Metric metric,
                                  QString* error = nullptr) = 0;
    // Deleting a missing collection succeeds.
    virtual bool deleteCollection(const QString& name, QString* error = nullptr) = 0;
    virtual bool listCollections(QStringList* out, QString* error = nullptr) = 0;

    // ── Fragments ───────────────────────────────────────────

    // Inserts or replaces points by id.
    virtual bool upsert(const QString& collection, const std::vector<FragmentPoint>& points,
                        QString* error = nullptr) = 0;
    // Ids that are not stored are ignored.
    virtual bool remove(const QString& collection, const QStringList& ids,
                        QString* error = nullptr) = 0;
    // Rewrites the path of stored fragments in place (rename).
    virtual bool setFragmentPath(const QString& collection, const QStringList& ids,
                                 const QString& path, QString* error = nullptr) = 0;
    // Stored points for ids, vectors included, in the order of ids. Ids
    // that are not stored are skipped.
    virtual bool fetchFragments(const QString& collection, const QStringList& ids,
                                std::vector<FragmentPoint>* out, QString* error = nullptr) = 0;
    virtual bool listFragments(const QString& collection, std::vector<FragmentListing>* out,
                               QString* error = nullptr) = 0;
    virtual bool countFragments(const QString& collection, int64_t* out,
                                QString* error = nullptr) = 0;
    virtual bool search(const QString& collection, const std::vector<float>& vector, int limit,
                        std::vector<ScoredFragment>* out, QString* error = nullptr) = 0;

    // ── Metadata records ────────────────────────────────────

    // *out is nullopt when no record has the id.
    virtual bool getMetadata(const QString& recordId, std::optional<QByteArray>* out,
                             QString* error = nullptr) = 0;
    virtual bool putMetadata(const QString& recordId, const QByteArray& payload,
                             QString* error = nullptr) = 0;

protected:
    VectorStore() = default;
};

} // namespace rw
