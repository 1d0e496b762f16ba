#pragma once

#include "core/shared/settings.h"

#include <QObject>
#include <QStringList>

#include <memory>

class QSocketNotifier;
class QTimer;

namespace rw {

class CrossEncoderReranker;
class EmbeddingManager;
class ExtractionManager;
class SqliteVectorStore;
class WatcherOrchestrator;

// WatchService - composition root of the ragwatchd daemon.
//
// Parses the command line, loads Settings, constructs the store, models,
// extraction gateway and orchestrator, restores the persisted folders and
// runs the Qt event loop until SIGINT or SIGTERM. With --search it answers
// one query against the existing collections and exits instead.
class WatchService : public QObject {
    Q_OBJECT
public:
    explicit WatchService(QObject* parent = nullptr);
    ~WatchService() override;

    int run();

private slots:
    void onSignal();
    void logStatus();

private:
    bool loadSettings(const QString& configPath);
    bool openStore();
    bool loadModels(bool needReranker);
    int runSearch(const QString& query, int limit);
    bool installSignalHandlers();
    void shutdown();

    Settings m_settings;
    std::unique_ptr<SqliteVectorStore> m_store;
    std::unique_ptr<EmbeddingManager> m_embedder;
    std::unique_ptr<CrossEncoderReranker> m_reranker;
    std::unique_ptr<ExtractionManager> m_extractor;
    std::unique_ptr<WatcherOrchestrator> m_orchestrator;

    QSocketNotifier* m_signalNotifier = nullptr;
    QTimer* m_statusTimer = nullptr;
};

} // namespace rw
