#pragma once

#include <QString>
#include <cstdint>

namespace rw {

struct Settings {
    // Storage
    QString storePath;
    QString collectionPrefix = QStringLiteral("rag");

    // Chunking
    int chunkSizeWords = 150;
    double chunkOverlapRatio = 0.15;
    int minContentChars = 10;
    int previewChars = 100;

    // Event handling
    int debounceMs = 500;

    // Worker pool
    int workerCount = 4;
    int queueDepth = 256;

    // Retry of transient store/embedding failures
    int retryBaseDelayMs = 500;
    int retryMaxDelayMs = 8000;
    int retryMaxAttempts = 3;
    int errorSweepIntervalMs = 30000;

    // PersistedState writes
    int persistIntervalMs = 2000;

    // Extraction limits
    int64_t maxFileSize = 104857600;         // 100 MB
    uint32_t extractionTimeoutMs = 30000;
    QString textFallbackEncoding = QStringLiteral("ISO-8859-1");

    // Models
    int vectorDimensions = 768;
    QString embeddingModelPath;
    QString embeddingVocabPath;
    QString passagePrefix = QStringLiteral("search_document: ");
    QString queryPrefix = QStringLiteral("search_query: ");
    QString rerankerModelPath;
    QString rerankerVocabPath;

    // Query side
    double searchScoreThreshold = 0.15;
    double rerankScoreThreshold = 0.35;
};

} // namespace rw
