#pragma once

#include "core/shared/errors.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace rw {

class EmbeddingProvider;
class RerankingProvider;
class VectorStore;

struct SearchHit {
    QString fragmentId;
    QString collection;
    QString path;
    int chunkIndex = 0;
    QString preview;
    float vectorScore = 0.0f;
    std::optional<float> rerankScore;   // unset when no reranker ran
};

struct SearchConfig {
    float scoreThreshold = 0.15f;       // cosine similarity floor
    float rerankThreshold = 0.35f;      // reranker score floor
    int candidateMultiplier = 4;        // vector hits fetched per requested result
};

struct SearchOutcome {
    std::vector<SearchHit> hits;
    std::optional<SyncError> error;

    bool ok() const { return !error.has_value(); }
};

// SemanticSearch - query side of the index.
//
// Embeds the query, searches every given collection, keeps hits above
// the similarity floor and, when a reranker is configured, reorders the
// survivors by reranker score and drops those below the rerank floor.
// A reranker failure falls back to vector order.
class SemanticSearch {
public:
    SemanticSearch(VectorStore& store, EmbeddingProvider& embedder,
                   RerankingProvider* reranker, SearchConfig config = {});

    SearchOutcome search(const QString& query, const QStringList& collections, int limit) const;

private:
    VectorStore& m_store;
    EmbeddingProvider& m_embedder;
    RerankingProvider* m_reranker;
    SearchConfig m_config;
};

} // namespace rw
