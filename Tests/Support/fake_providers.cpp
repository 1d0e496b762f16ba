#include "fake_providers.h"

#include <QRegularExpression>
#include <QSet>
#include <QStringList>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace rw::test {

namespace {

QStringList wordsOf(const QString& text)
{
    static const QRegularExpression separators(QStringLiteral("[^\\w]+"));
    return text.toLower().split(separators, Qt::SkipEmptyParts);
}

} // namespace

// ── FakeEmbeddingProvider ───────────────────────────────────

FakeEmbeddingProvider::FakeEmbeddingProvider(int dimensions)
    : m_dimensions(dimensions)
{
}

bool FakeEmbeddingProvider::shouldFail()
{
    if (m_failing.load()) {
        return true;
    }
    int budget = m_failBudget.load();
    while (budget > 0) {
        if (m_failBudget.compare_exchange_weak(budget, budget - 1)) {
            return true;
        }
    }
    return false;
}

std::vector<float> FakeEmbeddingProvider::vectorFor(const QString& text) const
{
    std::vector<float> v(static_cast<size_t>(m_dimensions), 0.0f);
    for (const QString& word : wordsOf(text)) {
        const size_t bucket = qHash(word, 0U) % static_cast<size_t>(m_dimensions);
        v[bucket] += 1.0f;
    }

    double norm = 0.0;
    for (float x : v) {
        norm += static_cast<double>(x) * x;
    }
    if (norm <= 0.0) {
        v[0] = 1.0f;
        return v;
    }
    const float inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (float& x : v) {
        x *= inv;
    }
    return v;
}

std::vector<std::vector<float>> FakeEmbeddingProvider::embedPassages(
    const std::vector<QString>& texts)
{
    ++m_passageCalls;
    const int delayMs = m_delayMs.load();
    if (delayMs > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    }
    if (shouldFail()) {
        return {};
    }
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const QString& text : texts) {
        out.push_back(vectorFor(text));
    }
    m_passagesEmbedded += static_cast<int>(texts.size());
    return out;
}

std::vector<float> FakeEmbeddingProvider::embedQuery(const QString& text)
{
    ++m_queryCalls;
    if (shouldFail()) {
        return {};
    }
    return vectorFor(text);
}

// ── FakeReranker ────────────────────────────────────────────

std::vector<RerankedCandidate> FakeReranker::rerank(const QString& query,
                                                    const std::vector<QString>& candidates,
                                                    int topK)
{
    ++m_calls;
    if (m_failing.load() || candidates.empty() || topK <= 0) {
        return {};
    }

    const QStringList queryWords = wordsOf(query);
    std::vector<RerankedCandidate> out;
    for (size_t i = 0; i < candidates.size(); ++i) {
        RerankedCandidate c;
        c.index = static_cast<int>(i);
        c.text = candidates[i];
        if (m_score) {
            c.score = m_score(query, candidates[i]);
        } else if (!queryWords.isEmpty()) {
            const QStringList words = wordsOf(candidates[i]);
            const QSet<QString> present(words.begin(), words.end());
            int hits = 0;
            for (const QString& w : queryWords) {
                if (present.contains(w)) {
                    ++hits;
                }
            }
            c.score = static_cast<float>(hits) / static_cast<float>(queryWords.size());
        }
        out.push_back(std::move(c));
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const RerankedCandidate& a, const RerankedCandidate& b) {
                         return a.score > b.score;
                     });
    if (out.size() > static_cast<size_t>(topK)) {
        out.resize(static_cast<size_t>(topK));
    }
    return out;
}

} // namespace rw::test
