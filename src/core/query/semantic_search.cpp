#include "core/query/semantic_search.h"
#include "core/embedding/embedding_provider.h"
#include "core/ranking/reranking_provider.h"
#include "core/shared/logging.h"
#include "core/vector/vector_store.h"

#include <QElapsedTimer>
#include <QSet>

#include <algorithm>

namespace rw {

SemanticSearch::SemanticSearch(VectorStore& store, EmbeddingProvider& embedder,
                               RerankingProvider* reranker, SearchConfig config)
    : m_store(store)
    , m_embedder(embedder)
    , m_reranker(reranker)
    , m_config(config)
{
}

SearchOutcome SemanticSearch::search(const QString& query, const QStringList& collections,
                                     int limit) const
{
    SearchOutcome outcome;
    const QString trimmed = query.trimmed();
    if (trimmed.isEmpty() || limit <= 0) {
        outcome.error = SyncError{SyncError::Code::InvalidArgument,
                                  QStringLiteral("empty query or non-positive limit")};
        return outcome;
    }
    if (collections.isEmpty()) {
        return outcome;
    }

    QElapsedTimer timer;
    timer.start();

    const std::vector<float> queryVector = m_embedder.embedQuery(trimmed);
    if (queryVector.empty()) {
        outcome.error = SyncError{SyncError::Code::EmbeddingProvider,
                                  QStringLiteral("query embedding failed")};
        return outcome;
    }

    // ── Vector recall ───────────────────────────────────────
    const int candidateLimit = limit * std::max(1, m_config.candidateMultiplier);
    std::vector<SearchHit> candidates;
    QSet<QString> seen;
    int failedCollections = 0;
    QString lastError;

    for (const QString& collection : collections) {
        std::vector<ScoredFragment> fragments;
        QString error;
        if (!m_store.search(collection, queryVector, candidateLimit, &fragments, &error)) {
            LOG_WARN(rwCore, "Search in %s failed: %s", qUtf8Printable(collection),
                     qUtf8Printable(error));
            ++failedCollections;
            lastError = error;
            continue;
        }
        for (const ScoredFragment& fragment : fragments) {
            if (fragment.score < m_config.scoreThreshold || seen.contains(fragment.id)) {
                continue;
            }
            seen.insert(fragment.id);
            SearchHit hit;
            hit.fragmentId = fragment.id;
            hit.collection = collection;
            hit.path = fragment.payload.path;
            hit.chunkIndex = fragment.payload.chunkIndex;
            hit.preview = fragment.payload.contentPreview;
            hit.vectorScore = fragment.score;
            candidates.push_back(std::move(hit));
        }
    }

    if (failedCollections == collections.size()) {
        outcome.error = SyncError{SyncError::Code::IndexStore, lastError};
        return outcome;
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const SearchHit& a, const SearchHit& b) {
                         return a.vectorScore > b.vectorScore;
                     });
    if (static_cast<int>(candidates.size()) > candidateLimit) {
        candidates.resize(static_cast<size_t>(candidateLimit));
    }

    // ── Rerank ──────────────────────────────────────────────
    if (m_reranker && !candidates.empty()) {
        std::vector<QString> texts;
        texts.reserve(candidates.size());
        for (const SearchHit& hit : candidates) {
            texts.push_back(hit.preview);
        }

        const std::vector<RerankedCandidate> ranked =
            m_reranker->rerank(trimmed, texts, static_cast<int>(texts.size()));
        if (ranked.empty()) {
            LOG_WARN(rwCore, "Reranking failed, keeping vector order for '%s'",
                     qUtf8Printable(trimmed));
        } else {
            std::vector<SearchHit> reordered;
            for (const RerankedCandidate& candidate : ranked) {
                if (candidate.score < m_config.rerankThreshold || candidate.index < 0
                    || candidate.index >= static_cast<int>(candidates.size())) {
                    continue;
                }
                SearchHit hit = candidates[static_cast<size_t>(candidate.index)];
                hit.rerankScore = candidate.score;
                reordered.push_back(std::move(hit));
            }
            candidates = std::move(reordered);
        }
    }

    if (static_cast<int>(candidates.size()) > limit) {
        candidates.resize(static_cast<size_t>(limit));
    }
    outcome.hits = std::move(candidates);

    LOG_DEBUG(rwCore, "Search '%s': %d hits in %lld ms", qUtf8Printable(trimmed),
              static_cast<int>(outcome.hits.size()), static_cast<long long>(timer.elapsed()));
    return outcome;
}

} // namespace rw
