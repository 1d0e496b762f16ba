#include "core/ranking/cross_encoder_reranker.h"
#include "core/embedding/tokenizer.h"
#include "core/models/model_session.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

#include <onnxruntime_cxx_api.h>

namespace rw {

CrossEncoderReranker::CrossEncoderReranker(RerankerConfig config)
    : m_config(std::move(config))
{
}

CrossEncoderReranker::~CrossEncoderReranker() = default;

bool CrossEncoderReranker::initialize()
{
    m_available = false;
    m_tokenizer = std::make_unique<WordPieceTokenizer>(m_config.vocabPath,
                                                       m_config.maxSequenceLength);
    if (!m_tokenizer->isLoaded()) {
        LOG_WARN(rwModels, "CrossEncoderReranker: tokenizer unavailable");
        return false;
    }

    m_session = std::make_unique<ModelSession>(
        QStringLiteral("cross-encoder"),
        QStringList{QStringLiteral("input_ids"), QStringLiteral("attention_mask")});
    if (!m_session->initialize(m_config.modelPath)) {
        LOG_WARN(rwModels, "CrossEncoderReranker: cross-encoder session unavailable");
        return false;
    }

    m_outputName = m_session->outputNames().front();
    m_hasTokenTypeIds = m_session->hasInput("token_type_ids");
    m_available = true;
    return true;
}

bool CrossEncoderReranker::scoreBatch(const QString& query, const std::vector<QString>& texts,
                                      std::vector<float>* scores) const
{
    std::vector<std::pair<QString, QString>> pairs;
    pairs.reserve(texts.size());
    for (const QString& text : texts) {
        pairs.emplace_back(query, text);
    }

    const TokenBatch batch = m_tokenizer->encodePairs(pairs);
    if (batch.isEmpty()) {
        return false;
    }

    try {
        const int64_t inputShape[2] = {
            static_cast<int64_t>(batch.batchSize),
            static_cast<int64_t>(batch.seqLength),
        };
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
            LOG_WARN(rwModels, "CrossEncoderReranker: missing tensor output");
            return false;
        }

        const std::vector<int64_t> shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* logits = outputs[0].GetTensorData<float>();
        if (!logits || shape.empty() || shape[0] != batch.batchSize) {
            LOG_WARN(rwModels, "CrossEncoderReranker: unexpected output shape");
            return false;
        }
        // [batch] or [batch x labels]; the first label is relevance.
        const int64_t stride = shape.size() >= 2 ? std::max<int64_t>(1, shape[1]) : 1;
        for (int i = 0; i < batch.batchSize; ++i) {
            const float logit = logits[static_cast<size_t>(i * stride)];
            scores->push_back(1.0f / (1.0f + std::exp(-logit)));
        }
        return true;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(rwModels, "CrossEncoderReranker inference failed: %s", ex.what());
        return false;
    }
}

std::vector<RerankedCandidate> CrossEncoderReranker::rerank(const QString& query,
                                                            const std::vector<QString>& candidates,
                                                            int topK)
{
    if (!m_available || candidates.empty() || topK <= 0) {
        return {};
    }

    std::vector<float> scores;
    scores.reserve(candidates.size());
    const size_t step = static_cast<size_t>(std::max(1, m_config.maxBatchSize));
    for (size_t begin = 0; begin < candidates.size(); begin += step) {
        const size_t end = std::min(candidates.size(), begin + step);
        const std::vector<QString> slice(candidates.begin() + begin, candidates.begin() + end);
        if (!scoreBatch(query, slice, &scores)) {
            return {};
        }
    }

    std::vector<RerankedCandidate> ranked;
    ranked.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        ranked.push_back(RerankedCandidate{static_cast<int>(i), candidates[i], scores[i]});
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RerankedCandidate& a, const RerankedCandidate& b) {
                         return a.score > b.score;
                     });
    if (static_cast<int>(ranked.size()) > topK) {
        ranked.resize(static_cast<size_t>(topK));
    }
    return ranked;
}

} // namespace rw
