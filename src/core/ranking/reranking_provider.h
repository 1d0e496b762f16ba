#pragma once

#include <QString>

#include <vector>

namespace rw {

struct RerankedCandidate {
    int index = 0;              // position in the candidate list
    QString text;
    float score = 0.0f;
};

// RerankingProvider - query-time relevance scoring of candidate texts.
// Returns at most topK candidates sorted by descending score; an empty
// result for non-empty input means the provider failed.
class RerankingProvider {
public:
    virtual ~RerankingProvider() = default;

    virtual std::vector<RerankedCandidate> rerank(const QString& query,
                                                  const std::vector<QString>& candidates,
                                                  int topK) = 0;
};

} // namespace rw
