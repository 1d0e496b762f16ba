#pragma once

#include "core/embedding/embedding_provider.h"

#include <QString>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rw {

class ModelSession;
class WordPieceTokenizer;

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

struct EmbeddingConfig {
    QString modelPath;
    QString vocabPath;
    int dimensions = 768;
    QString passagePrefix = QStringLiteral("search_document: ");
    QString queryPrefix = QStringLiteral("search_query: ");
    int maxSequenceLength = 512;
    int maxBatchSize = 32;
};

// EmbeddingManager: ONNX Runtime bi-encoder behind EmbeddingProvider.
//
// Token embeddings are mean-pooled over the attention mask (a model that
// already outputs [batch x dims] is used as is) and L2-normalized.
// Passages and queries get their own prompt prefix.
class EmbeddingManager : public EmbeddingProvider {
public:
    explicit EmbeddingManager(EmbeddingConfig config);
    ~EmbeddingManager() override;

    EmbeddingManager(const EmbeddingManager&) = delete;
    EmbeddingManager& operator=(const EmbeddingManager&) = delete;
    EmbeddingManager(EmbeddingManager&&) = delete;
    EmbeddingManager& operator=(EmbeddingManager&&) = delete;

    bool initialize();
    bool isAvailable() const { return m_available; }

    int dimensions() const override { return m_config.dimensions; }
    std::vector<std::vector<float>> embedPassages(const std::vector<QString>& texts) override;
    std::vector<float> embedQuery(const QString& text) override;

    // Expose for testing
    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

    static std::vector<float> normalizeEmbedding(std::vector<float> embedding);

private:
    std::vector<std::vector<float>> embedBatch(const std::vector<QString>& texts);
    std::vector<std::vector<float>> runBatch(const std::vector<QString>& texts);

    EmbeddingConfig m_config;
    std::unique_ptr<ModelSession> m_session;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    std::string m_outputName;
    bool m_hasTokenTypeIds = false;
    bool m_available = false;
    EmbeddingCircuitBreaker m_circuitBreaker;
};

} // namespace rw
