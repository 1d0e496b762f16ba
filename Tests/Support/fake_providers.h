#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/ranking/reranking_provider.h"

#include <QString>

#include <atomic>
#include <functional>
#include <vector>

namespace rw::test {

// Bag-of-words embedding: every lower-cased word adds 1 to a hashed
// bucket, then the vector is L2-normalized. Texts sharing words are close.
class FakeEmbeddingProvider : public EmbeddingProvider {
public:
    explicit FakeEmbeddingProvider(int dimensions = 8);

    int dimensions() const override { return m_dimensions; }
    std::vector<std::vector<float>> embedPassages(const std::vector<QString>& texts) override;
    std::vector<float> embedQuery(const QString& text) override;

    std::vector<float> vectorFor(const QString& text) const;

    void setFailing(bool failing) { m_failing.store(failing); }
    void failNext(int times) { m_failBudget.store(times); }
    // Sleep inside every passage call (widens race windows in tests).
    void setDelayMs(int delayMs) { m_delayMs.store(delayMs); }

    int passageCalls() const { return m_passageCalls.load(); }
    int passagesEmbedded() const { return m_passagesEmbedded.load(); }
    int queryCalls() const { return m_queryCalls.load(); }

private:
    bool shouldFail();

    const int m_dimensions;
    std::atomic<bool> m_failing{false};
    std::atomic<int> m_failBudget{0};
    std::atomic<int> m_delayMs{0};
    std::atomic<int> m_passageCalls{0};
    std::atomic<int> m_passagesEmbedded{0};
    std::atomic<int> m_queryCalls{0};
};

// Scores a candidate by the share of query words it contains, unless a
// scoring function is installed.
class FakeReranker : public RerankingProvider {
public:
    using ScoreFn = std::function<float(const QString& query, const QString& text)>;

    std::vector<RerankedCandidate> rerank(const QString& query,
                                          const std::vector<QString>& candidates,
                                          int topK) override;

    void setScoreFunction(ScoreFn fn) { m_score = std::move(fn); }
    void setFailing(bool failing) { m_failing.store(failing); }
    int calls() const { return m_calls.load(); }

private:
    ScoreFn m_score;
    std::atomic<bool> m_failing{false};
    std::atomic<int> m_calls{0};
};

} // namespace rw::test
