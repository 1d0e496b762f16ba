#include "watch_service.h"
#include "core/embedding/embedding_manager.h"
#include "core/extraction/extraction_manager.h"
#include "core/indexing/watcher_orchestrator.h"
#include "core/query/semantic_search.h"
#include "core/ranking/cross_encoder_reranker.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/vector/sqlite_vector_store.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QSocketNotifier>
#include <QTextStream>
#include <QTimer>

#include <algorithm>
#include <csignal>
#include <optional>
#include <sys/socket.h>
#include <unistd.h>

namespace rw {

namespace {

constexpr int kStatusIntervalMs = 60000;

int g_signalFds[2] = {-1, -1};

void handleSignal(int)
{
    const char byte = 1;
    // Only async-signal-safe calls here.
    const ssize_t written = ::write(g_signalFds[0], &byte, sizeof(byte));
    (void)written;
}

} // namespace

WatchService::WatchService(QObject* parent)
    : QObject(parent)
{
}

WatchService::~WatchService()
{
    shutdown();
}

int WatchService::run()
{
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Keeps watched folders synchronized with a local vector index."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringList{QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Settings file (default: $RAGWATCH_SETTINGS or the data directory)."),
        QStringLiteral("file"));
    const QCommandLineOption watchOption(
        QStringList{QStringLiteral("w"), QStringLiteral("watch")},
        QStringLiteral("Folder to watch; may be repeated."), QStringLiteral("path"));
    const QCommandLineOption typesOption(
        QStringList{QStringLiteral("t"), QStringLiteral("types")},
        QStringLiteral("Content types for --watch folders, comma separated (text,pdf)."),
        QStringLiteral("types"), QStringLiteral("text"));
    const QCommandLineOption unwatchOption(
        QStringLiteral("unwatch"), QStringLiteral("Stop watching a folder and drop its index."),
        QStringLiteral("path"));
    const QCommandLineOption searchOption(
        QStringList{QStringLiteral("s"), QStringLiteral("search")},
        QStringLiteral("Run one query against the index and exit."), QStringLiteral("query"));
    const QCommandLineOption limitOption(
        QStringLiteral("limit"), QStringLiteral("Number of search results."),
        QStringLiteral("n"), QStringLiteral("10"));

    parser.addOptions({configOption, watchOption, typesOption, unwatchOption, searchOption,
                       limitOption});
    parser.process(*QCoreApplication::instance());

    if (!loadSettings(parser.value(configOption)) || !openStore()) {
        return 1;
    }

    if (parser.isSet(searchOption)) {
        if (!loadModels(true)) {
            return 1;
        }
        return runSearch(parser.value(searchOption), parser.value(limitOption).toInt());
    }

    if (!loadModels(false)) {
        return 1;
    }

    ExtractionConfig extractionConfig;
    extractionConfig.maxFileSize = m_settings.maxFileSize;
    extractionConfig.timeoutMs = static_cast<int>(m_settings.extractionTimeoutMs);
    extractionConfig.maxConcurrent = std::max(1, m_settings.workerCount);
    extractionConfig.textFallbackEncoding = m_settings.textFallbackEncoding.toLatin1();
    m_extractor = std::make_unique<ExtractionManager>(extractionConfig);

    m_orchestrator = std::make_unique<WatcherOrchestrator>(m_settings, *m_store, *m_embedder,
                                                           *m_extractor);
    const SyncResult restored = m_orchestrator->restore();
    if (!restored.ok()) {
        LOG_WARN(rwCore, "Restore failed (%s): %s",
                 qUtf8Printable(syncErrorCodeToString(restored.error->code)),
                 qUtf8Printable(restored.error->message));
    }

    for (const QString& path : parser.values(unwatchOption)) {
        const SyncResult result = m_orchestrator->unwatchFolder(path);
        if (!result.ok()) {
            LOG_ERROR(rwCore, "Cannot unwatch %s: %s", qUtf8Printable(path),
                      qUtf8Printable(result.error->message));
        }
    }

    const QStringList types = parser.value(typesOption).split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const QString& path : parser.values(watchOption)) {
        const WatchFolderResult result = m_orchestrator->watchFolder(path, types);
        if (!result.ok()) {
            LOG_ERROR(rwCore, "Cannot watch %s (%s): %s", qUtf8Printable(path),
                      qUtf8Printable(syncErrorCodeToString(result.error->code)),
                      qUtf8Printable(result.error->message));
        }
    }

    if (!installSignalHandlers()) {
        LOG_WARN(rwCore, "Signal handlers unavailable; stop with the service manager");
    }

    m_statusTimer = new QTimer(this);
    m_statusTimer->setInterval(kStatusIntervalMs);
    connect(m_statusTimer, &QTimer::timeout, this, &WatchService::logStatus);
    m_statusTimer->start();

    LOG_INFO(rwCore, "ragwatchd running with %d folders",
             static_cast<int>(m_orchestrator->watchedFolders().size()));
    const int rc = QCoreApplication::exec();
    shutdown();
    return rc;
}

bool WatchService::loadSettings(const QString& configPath)
{
    const QString path = configPath.isEmpty() ? SettingsManager::settingsFilePath() : configPath;
    std::optional<Settings> loaded = SettingsManager::load(path);
    if (loaded.has_value()) {
        m_settings = loaded.value();
        LOG_INFO(rwCore, "Settings loaded from %s", qUtf8Printable(path));
    } else if (!configPath.isEmpty()) {
        LOG_ERROR(rwCore, "Cannot load settings from %s", qUtf8Printable(configPath));
        return false;
    } else {
        LOG_INFO(rwCore, "No settings file at %s, using defaults", qUtf8Printable(path));
    }

    if (m_settings.storePath.isEmpty()) {
        m_settings.storePath = SettingsManager::defaultStorePath();
    }
    return true;
}

bool WatchService::openStore()
{
    const QString dir = QFileInfo(m_settings.storePath).absolutePath();
    if (!QDir().mkpath(dir)) {
        LOG_ERROR(rwCore, "Cannot create store directory %s", qUtf8Printable(dir));
        return false;
    }

    QString error;
    m_store = SqliteVectorStore::open(m_settings.storePath, &error);
    if (!m_store) {
        LOG_ERROR(rwCore, "Cannot open vector store %s: %s", qUtf8Printable(m_settings.storePath),
                  qUtf8Printable(error));
        return false;
    }
    return true;
}

bool WatchService::loadModels(bool needReranker)
{
    EmbeddingConfig embeddingConfig;
    embeddingConfig.modelPath = m_settings.embeddingModelPath;
    embeddingConfig.vocabPath = m_settings.embeddingVocabPath;
    embeddingConfig.dimensions = m_settings.vectorDimensions;
    embeddingConfig.passagePrefix = m_settings.passagePrefix;
    embeddingConfig.queryPrefix = m_settings.queryPrefix;
    m_embedder = std::make_unique<EmbeddingManager>(embeddingConfig);
    if (!m_embedder->initialize()) {
        LOG_ERROR(rwCore, "Embedding model unavailable (model %s, vocab %s)",
                  qUtf8Printable(m_settings.embeddingModelPath),
                  qUtf8Printable(m_settings.embeddingVocabPath));
        return false;
    }

    if (needReranker && !m_settings.rerankerModelPath.isEmpty()) {
        RerankerConfig rerankerConfig;
        rerankerConfig.modelPath = m_settings.rerankerModelPath;
        rerankerConfig.vocabPath = m_settings.rerankerVocabPath;
        m_reranker = std::make_unique<CrossEncoderReranker>(rerankerConfig);
        if (!m_reranker->initialize()) {
            LOG_WARN(rwCore, "Reranker unavailable, results keep vector order");
            m_reranker.reset();
        }
    }
    return true;
}

int WatchService::runSearch(const QString& query, int limit)
{
    QStringList collections;
    QString error;
    if (!m_store->listCollections(&collections, &error)) {
        LOG_ERROR(rwCore, "Cannot list collections: %s", qUtf8Printable(error));
        return 1;
    }

    SearchConfig config;
    config.scoreThreshold = static_cast<float>(m_settings.searchScoreThreshold);
    config.rerankThreshold = static_cast<float>(m_settings.rerankScoreThreshold);
    const SemanticSearch search(*m_store, *m_embedder, m_reranker.get(), config);

    const SearchOutcome outcome = search.search(query, collections, limit);
    if (!outcome.ok()) {
        LOG_ERROR(rwCore, "Search failed (%s): %s",
                  qUtf8Printable(syncErrorCodeToString(outcome.error->code)),
                  qUtf8Printable(outcome.error->message));
        return 1;
    }

    QTextStream out(stdout);
    for (const SearchHit& hit : outcome.hits) {
        out << QString::number(hit.rerankScore.value_or(hit.vectorScore), 'f', 3) << '\t'
            << hit.path << '#' << hit.chunkIndex << '\t' << hit.preview << '\n';
    }
    return 0;
}

bool WatchService::installSignalHandlers()
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFds) != 0) {
        return false;
    }
    m_signalNotifier = new QSocketNotifier(g_signalFds[1], QSocketNotifier::Read, this);
    connect(m_signalNotifier, &QSocketNotifier::activated, this, &WatchService::onSignal);

    struct sigaction action = {};
    action.sa_handler = handleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    return ::sigaction(SIGINT, &action, nullptr) == 0
           && ::sigaction(SIGTERM, &action, nullptr) == 0;
}

void WatchService::onSignal()
{
    m_signalNotifier->setEnabled(false);
    char byte = 0;
    const ssize_t received = ::read(g_signalFds[1], &byte, sizeof(byte));
    (void)received;
    LOG_INFO(rwCore, "Termination requested");
    QCoreApplication::quit();
}

void WatchService::logStatus()
{
    if (!m_orchestrator) {
        return;
    }
    for (const FolderSnapshot& folder : m_orchestrator->watchedFolders()) {
        LOG_INFO(rwCore, "%s: %s %d%% (%llu/%llu %s, %d errors)", qUtf8Printable(folder.path),
                 qUtf8Printable(folderStatusToString(folder.status)), folder.progressPercent,
                 static_cast<unsigned long long>(folder.processedFiles),
                 static_cast<unsigned long long>(folder.totalFiles),
                 qUtf8Printable(countTypeToString(folder.countType)), folder.errorCount);
    }
}

void WatchService::shutdown()
{
    if (m_statusTimer) {
        m_statusTimer->stop();
    }
    if (m_orchestrator) {
        m_orchestrator->shutdown();
        m_orchestrator.reset();
    }
}

} // namespace rw
