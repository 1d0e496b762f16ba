#include <QtTest/QtTest>
#include "core/embedding/embedding_manager.h"
#include "core/models/model_session.h"

#include <QFile>
#include <QTemporaryDir>

#include <chrono>
#include <cmath>

namespace {

// Real-model checks run only when a model is provided.
bool modelFromEnvironment(rw::EmbeddingConfig* config)
{
    const QString model = qEnvironmentVariable("RAGWATCH_TEST_EMBEDDING_MODEL");
    const QString vocab = qEnvironmentVariable("RAGWATCH_TEST_EMBEDDING_VOCAB");
    if (model.isEmpty() || vocab.isEmpty()) {
        return false;
    }
    config->modelPath = model;
    config->vocabPath = vocab;
    const QString dims = qEnvironmentVariable("RAGWATCH_TEST_EMBEDDING_DIMS");
    if (!dims.isEmpty()) {
        config->dimensions = dims.toInt();
    }
    return true;
}

float dot(const std::vector<float>& a, const std::vector<float>& b)
{
    float sum = 0.0F;
    for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

} // namespace

class TestEmbeddingManager : public QObject {
    Q_OBJECT

private slots:
    // ── Circuit breaker ─────────────────────────────────────
    void testCircuitBreakerInitiallyClosed();
    void testCircuitBreakerOpensAfterThreshold();
    void testCircuitBreakerResetsOnSuccess();
    void testCircuitBreakerHalfOpenAfterDelay();

    // ── Without a model ─────────────────────────────────────
    void testNormalizeEmbedding();
    void testMissingModelIsUnavailable();
    void testInvalidDimensionsRejected();
    void testModelSessionMissingFile();

    // ── With a model ────────────────────────────────────────
    void testRealModelEmbeddings();
};

// ── Circuit breaker ─────────────────────────────────────────

void TestEmbeddingManager::testCircuitBreakerInitiallyClosed()
{
    rw::EmbeddingCircuitBreaker cb;
    QVERIFY(!cb.isOpen());
    QCOMPARE(cb.consecutiveFailures.load(), 0);
}

void TestEmbeddingManager::testCircuitBreakerOpensAfterThreshold()
{
    rw::EmbeddingCircuitBreaker cb;
    for (int i = 0; i < rw::EmbeddingCircuitBreaker::kOpenThreshold - 1; ++i) {
        cb.recordFailure();
    }
    QVERIFY(!cb.isOpen());

    cb.recordFailure();
    QVERIFY(cb.isOpen());
    QCOMPARE(cb.consecutiveFailures.load(), rw::EmbeddingCircuitBreaker::kOpenThreshold);
}

void TestEmbeddingManager::testCircuitBreakerResetsOnSuccess()
{
    rw::EmbeddingCircuitBreaker cb;
    cb.recordFailure();
    cb.recordFailure();
    QCOMPARE(cb.consecutiveFailures.load(), 2);

    cb.recordSuccess();
    QCOMPARE(cb.consecutiveFailures.load(), 0);
    QVERIFY(!cb.isOpen());
}

void TestEmbeddingManager::testCircuitBreakerHalfOpenAfterDelay()
{
    rw::EmbeddingCircuitBreaker cb;
    for (int i = 0; i < rw::EmbeddingCircuitBreaker::kOpenThreshold; ++i) {
        cb.recordFailure();
    }
    QVERIFY(cb.isOpen());

    // Pretend the last failure is older than the half-open delay.
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now().time_since_epoch())
                         .count();
    cb.lastFailureTime.store(now - rw::EmbeddingCircuitBreaker::kHalfOpenDelayMs - 1000);
    QVERIFY(!cb.isOpen());

    // A failed trial call closes the window again.
    cb.recordFailure();
    QVERIFY(cb.isOpen());
}

// ── Without a model ─────────────────────────────────────────

void TestEmbeddingManager::testNormalizeEmbedding()
{
    const std::vector<float> unit = rw::EmbeddingManager::normalizeEmbedding({3.0F, 4.0F});
    QVERIFY(std::abs(unit[0] - 0.6F) < 1e-6F);
    QVERIFY(std::abs(unit[1] - 0.8F) < 1e-6F);

    const std::vector<float> zero = rw::EmbeddingManager::normalizeEmbedding({0.0F, 0.0F});
    QCOMPARE(zero, (std::vector<float>{0.0F, 0.0F}));
}

void TestEmbeddingManager::testMissingModelIsUnavailable()
{
    rw::EmbeddingConfig config;
    config.modelPath = QStringLiteral("/definitely/missing/model.onnx");
    config.vocabPath = QStringLiteral("/definitely/missing/vocab.txt");
    config.dimensions = 384;

    rw::EmbeddingManager manager(config);
    QVERIFY(!manager.initialize());
    QVERIFY(!manager.isAvailable());
    QCOMPARE(manager.dimensions(), 384);
    QVERIFY(manager.embedPassages({QStringLiteral("hello")}).empty());
    QVERIFY(manager.embedQuery(QStringLiteral("hello")).empty());
}

void TestEmbeddingManager::testInvalidDimensionsRejected()
{
    rw::EmbeddingConfig config;
    config.dimensions = 0;
    rw::EmbeddingManager manager(config);
    QVERIFY(!manager.initialize());
}

void TestEmbeddingManager::testModelSessionMissingFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString bogus = dir.path() + QStringLiteral("/bogus.onnx");
    QFile file(bogus);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("not an onnx graph");
    file.close();

    rw::ModelSession missing(QStringLiteral("missing"), {QStringLiteral("input_ids")});
    QVERIFY(!missing.initialize(dir.path() + QStringLiteral("/absent.onnx")));
    QVERIFY(!missing.isAvailable());
    QVERIFY(missing.session() == nullptr);

    rw::ModelSession corrupt(QStringLiteral("corrupt"), {QStringLiteral("input_ids")});
    QVERIFY(!corrupt.initialize(bogus));
    QVERIFY(!corrupt.isAvailable());
}

// ── With a model ────────────────────────────────────────────

void TestEmbeddingManager::testRealModelEmbeddings()
{
    rw::EmbeddingConfig config;
    if (!modelFromEnvironment(&config)) {
        QSKIP("Set RAGWATCH_TEST_EMBEDDING_MODEL and RAGWATCH_TEST_EMBEDDING_VOCAB to run");
    }

    rw::EmbeddingManager manager(config);
    QVERIFY(manager.initialize());

    const auto passages = manager.embedPassages(
        {QStringLiteral("The cat sat on the mat."),
         QStringLiteral("Quarterly revenue grew by ten percent."),
         QStringLiteral("A kitten is sleeping on a rug.")});
    QCOMPARE(static_cast<int>(passages.size()), 3);
    for (const auto& vector : passages) {
        QCOMPARE(static_cast<int>(vector.size()), config.dimensions);
        QVERIFY(std::abs(dot(vector, vector) - 1.0F) < 1e-3F);
    }

    const std::vector<float> query = manager.embedQuery(QStringLiteral("cat on a carpet"));
    QCOMPARE(static_cast<int>(query.size()), config.dimensions);
    QVERIFY(dot(query, passages[0]) > dot(query, passages[1]));
    QVERIFY(dot(query, passages[2]) > dot(query, passages[1]));
}

QTEST_MAIN(TestEmbeddingManager)
#include "test_embedding_manager.moc"
