#pragma once

#include "core/ranking/reranking_provider.h"

#include <QString>

#include <memory>
#include <string>
#include <vector>

namespace rw {

class ModelSession;
class WordPieceTokenizer;

struct RerankerConfig {
    QString modelPath;
    QString vocabPath;
    int maxSequenceLength = 512;
    int maxBatchSize = 16;
};

// CrossEncoderReranker - scores (query, text) pairs with an ONNX
// cross-encoder. The score is the sigmoid of the first logit.
class CrossEncoderReranker : public RerankingProvider {
public:
    explicit CrossEncoderReranker(RerankerConfig config);
    ~CrossEncoderReranker() override;

    CrossEncoderReranker(const CrossEncoderReranker&) = delete;
    CrossEncoderReranker& operator=(const CrossEncoderReranker&) = delete;

    bool initialize();
    bool isAvailable() const { return m_available; }

    std::vector<RerankedCandidate> rerank(const QString& query,
                                          const std::vector<QString>& candidates,
                                          int topK) override;

private:
    bool scoreBatch(const QString& query, const std::vector<QString>& texts,
                    std::vector<float>* scores) const;

    RerankerConfig m_config;
    std::unique_ptr<ModelSession> m_session;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    std::string m_outputName;
    bool m_hasTokenTypeIds = false;
    bool m_available = false;
};

} // namespace rw
