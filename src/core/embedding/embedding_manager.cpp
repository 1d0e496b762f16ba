#include "core/embedding/embedding_manager.h"
#include "core/embedding/tokenizer.h"
#include "core/models/model_session.h"
#include "core/shared/logging.h"

#include <chrono>
#include <algorithm>
#include <cmath>

#include <onnxruntime_cxx_api.h>

namespace rw {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // Half-open once the delay has passed: one attempt is let through.
    return steadyNowMs() - lastFailureTime.load() < kHalfOpenDelayMs;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

EmbeddingManager::EmbeddingManager(EmbeddingConfig config)
    : m_config(std::move(config))
{
}

EmbeddingManager::~EmbeddingManager() = default;

bool EmbeddingManager::initialize()
{
    m_available = false;
    if (m_config.dimensions <= 0) {
        LOG_WARN(rwModels, "EmbeddingManager: invalid dimensions %d", m_config.dimensions);
        return false;
    }

    m_tokenizer = std::make_unique<WordPieceTokenizer>(m_config.vocabPath,
                                                       m_config.maxSequenceLength);
    if (!m_tokenizer->isLoaded()) {
        LOG_WARN(rwModels, "EmbeddingManager: tokenizer unavailable");
        return false;
    }

    m_session = std::make_unique<ModelSession>(
        QStringLiteral("bi-encoder"),
        QStringList{QStringLiteral("input_ids"), QStringLiteral("attention_mask")});
    if (!m_session->initialize(m_config.modelPath)) {
        LOG_WARN(rwModels, "EmbeddingManager: bi-encoder session unavailable");
        return false;
    }

    m_outputName = m_session->outputNames().front();
    m_hasTokenTypeIds = m_session->hasInput("token_type_ids");
    m_available = true;
    LOG_INFO(rwModels, "EmbeddingManager ready: %d dims, output '%s'", m_config.dimensions,
             m_outputName.c_str());
    return true;
}

std::vector<float> EmbeddingManager::normalizeEmbedding(std::vector<float> embedding)
{
    double sumSquares = 0.0;
    for (const float value : embedding) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }

    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return embedding;
    }

    for (float& value : embedding) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
    return embedding;
}

std::vector<std::vector<float>> EmbeddingManager::embedPassages(const std::vector<QString>& texts)
{
    std::vector<QString> framed;
    framed.reserve(texts.size());
    for (const QString& text : texts) {
        framed.push_back(m_config.passagePrefix + text);
    }
    return embedBatch(framed);
}

std::vector<float> EmbeddingManager::embedQuery(const QString& text)
{
    std::vector<std::vector<float>> result = embedBatch({m_config.queryPrefix + text});
    if (result.empty()) {
        return {};
    }
    return std::move(result.front());
}

std::vector<std::vector<float>> EmbeddingManager::embedBatch(const std::vector<QString>& texts)
{
    if (!m_available || texts.empty()) {
        return {};
    }
    if (m_circuitBreaker.isOpen()) {
        LOG_WARN(rwModels, "EmbeddingManager circuit breaker is open, skipping inference");
        return {};
    }

    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());
    const size_t step = static_cast<size_t>(std::max(1, m_config.maxBatchSize));
    for (size_t begin = 0; begin < texts.size(); begin += step) {
        const size_t end = std::min(texts.size(), begin + step);
        std::vector<std::vector<float>> part =
            runBatch(std::vector<QString>(texts.begin() + begin, texts.begin() + end));
        if (part.size() != end - begin) {
            m_circuitBreaker.recordFailure();
            return {};
        }
        for (auto& vector : part) {
            embeddings.push_back(std::move(vector));
        }
    }
    m_circuitBreaker.recordSuccess();
    return embeddings;
}

std::vector<std::vector<float>> EmbeddingManager::runBatch(const std::vector<QString>& texts)
{
    const TokenBatch batch = m_tokenizer->encode(texts);
    if (batch.isEmpty()) {
        return {};
    }

    const int64_t inputShape[2] = {
        static_cast<int64_t>(batch.batchSize),
        static_cast<int64_t>(batch.seqLength),
    };
    const int dims = m_config.dimensions;

    try {
        Ort::MemoryInfo memoryInfo =
            Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator, OrtMemTypeDefault);

        std::vector<Ort::Value> inputs;
        std::vector<const char*> inputNames;
        auto addInput = [&](const char* name, const std::vector<int64_t>& values) {
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(
                memoryInfo, const_cast<int64_t*>(values.data()), values.size(), inputShape, 2));
            inputNames.push_back(name);
        };
        addInput("input_ids", batch.inputIds);
        addInput("attention_mask", batch.attentionMask);
        if (m_hasTokenTypeIds) {
            addInput("token_type_ids", batch.tokenTypeIds);
        }

        const char* outputNames[1] = {m_outputName.c_str()};
        std::vector<Ort::Value> outputs = m_session->session()->Run(
            Ort::RunOptions{nullptr}, inputNames.data(), inputs.data(), inputs.size(),
            outputNames, 1);

        if (outputs.empty() || !outputs[0].IsTensor()) {
            LOG_WARN(rwModels, "EmbeddingManager inference failed: missing tensor output");
            return {};
        }

        const std::vector<int64_t> shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorData<float>();
        if (!data) {
            return {};
        }

        std::vector<std::vector<float>> embeddings;
        embeddings.reserve(static_cast<size_t>(batch.batchSize));

        if (shape.size() == 2 && shape[0] == batch.batchSize && shape[1] == dims) {
            for (int i = 0; i < batch.batchSize; ++i) {
                const float* row = data + static_cast<size_t>(i) * dims;
                embeddings.push_back(normalizeEmbedding(std::vector<float>(row, row + dims)));
            }
            return embeddings;
        }

        if (shape.size() == 3 && shape[0] == batch.batchSize && shape[2] == dims
            && shape[1] == batch.seqLength) {
            const int64_t seqLen = shape[1];
            for (int i = 0; i < batch.batchSize; ++i) {
                std::vector<float> pooled(static_cast<size_t>(dims), 0.0f);
                int tokens = 0;
                for (int64_t t = 0; t < seqLen; ++t) {
                    if (batch.attentionMask[static_cast<size_t>(i * seqLen + t)] == 0) {
                        continue;
                    }
                    const float* token = data + static_cast<size_t>((i * seqLen + t) * dims);
                    for (int j = 0; j < dims; ++j) {
                        pooled[static_cast<size_t>(j)] += token[j];
                    }
                    ++tokens;
                }
                if (tokens > 0) {
                    for (float& value : pooled) {
                        value /= static_cast<float>(tokens);
                    }
                }
                embeddings.push_back(normalizeEmbedding(std::move(pooled)));
            }
            return embeddings;
        }

        LOG_WARN(rwModels, "EmbeddingManager inference failed: unsupported output shape (rank %zu)",
                 shape.size());
        return {};
    } catch (const Ort::Exception& ex) {
        LOG_WARN(rwModels, "EmbeddingManager inference failed: %s", ex.what());
        return {};
    }
}

} // namespace rw
