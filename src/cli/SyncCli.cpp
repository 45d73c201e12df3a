#include "cli/SyncCli.hpp"

#include <iostream>
#include <memory>
#include <string>

#include <QEventLoop>
#include <QTimer>

#include "common/config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/mark_as_read_service.hpp"
#include "engine/notification_sink.hpp"
#include "engine/status_dispatcher.hpp"
#include "engine/sync_coordinator.hpp"
#include "engine/sync_engine.hpp"
#include "remote/connectivity.hpp"
#include "remote/miniflux_api_client.hpp"
#include "store/entry_status_store.hpp"

namespace fluxsync {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  fluxsync-cli [--offline] [--trace] COMMAND\n"
        "\n"
        "Commands:\n"
        "  status ID\n"
        "  mark ID read|unread\n"
        "  mark-entries read|unread ID...\n"
        "  mark-feed ID\n"
        "  mark-category ID\n"
        "  fetch [--limit N]\n"
        "  queue [--format text|json]\n"
        "  sync [--yes]\n"
        "  clear-queue [--yes]\n"
        "  purge ID\n"
        "  counts\n");
}

class ConsoleNotificationSink : public NotificationSink
{
public:
    void info(const std::string &message) override
    {
        std::cout << "[info] " << message << "\n";
        m_log.info(message);
    }

    void success(const std::string &message) override
    {
        std::cout << "[ok] " << message << "\n";
        m_log.success(message);
    }

    void error(const std::string &message) override
    {
        std::cerr << "[error] " << message << "\n";
        m_log.error(message);
    }

private:
    LoggingNotificationSink m_log;
};

class ConsolePrompt : public ConfirmationPrompt
{
public:
    ConsolePrompt(bool assumeYes, std::istream &input)
        : m_assumeYes(assumeYes)
        , m_input(input)
    {
    }

    SyncDecision confirmSync(const QueueCounts &counts) override
    {
        if (m_assumeYes) {
            return SyncDecision::SyncNow;
        }
        const std::size_t total = counts.total();
        std::cout << (total == 1 ? std::string("Sync 1 pending change?")
                                 : "Sync " + std::to_string(total) + " pending changes?")
                  << " [s]ync now / [l]ater / [d]elete queue: " << std::flush;
        std::string answer;
        std::getline(m_input, answer);
        if (answer == "s" || answer == "sync") {
            return SyncDecision::SyncNow;
        }
        if (answer == "d" || answer == "delete") {
            return SyncDecision::DeleteQueue;
        }
        return SyncDecision::Later;
    }

    bool confirmClear(std::size_t pendingCount) override
    {
        if (m_assumeYes) {
            return true;
        }
        std::cout << "Discard " << pendingCount << " unsynced changes? [y/N]: " << std::flush;
        std::string answer;
        std::getline(m_input, answer);
        return answer == "y" || answer == "yes";
    }

private:
    bool m_assumeYes;
    std::istream &m_input;
};

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

std::optional<EntryStatus> parseTargetStatus(const QString &value)
{
    const auto status = parseStatusString(value.toLower().toStdString());
    if (!status || *status == EntryStatus::Removed) {
        return std::nullopt;
    }
    return status;
}

// Runs the event loop until `signal` fires or the timeout elapses.
template <typename Sender, typename Signal>
bool waitForSignal(Sender *sender, Signal signal, int timeoutMs)
{
    QEventLoop loop;
    bool fired = false;
    QObject::connect(sender, signal, &loop, [&fired, &loop]() {
        fired = true;
        loop.quit();
    });
    QTimer::singleShot(timeoutMs, &loop, &QEventLoop::quit);
    loop.exec();
    return fired;
}

const char *dispatchResultName(DispatchResult result)
{
    switch (result) {
    case DispatchResult::InvalidRequest:
        return "invalid";
    case DispatchResult::NoOp:
        return "unchanged";
    case DispatchResult::Dispatched:
        return "dispatched";
    case DispatchResult::Queued:
        return "queued";
    case DispatchResult::LocalWriteFailed:
        return "failed";
    }
    return "failed";
}

} // namespace

SyncCli::SyncCli(RemoteApiFactory apiFactory)
    : m_apiFactory(std::move(apiFactory))
{
}

int SyncCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    bool offline = false;
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--offline")) {
            offline = true;
            continue;
        }
        args.push_back(arg);
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    FSLOG_INFO(QStringLiteral("SyncCli"),
               QStringLiteral("run"),
               QStringLiteral("sync_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()}, {"offline", offline}}));

    const Settings settings = loadSettings();
    std::unique_ptr<ConnectivityProbe> probe;
    if (offline) {
        probe = std::make_unique<StaticConnectivityProbe>(false);
    } else {
        probe = std::make_unique<SystemConnectivityProbe>();
    }

    ConsoleNotificationSink notifications;
    std::unique_ptr<SyncEngine> engine;
    try {
        engine = std::make_unique<SyncEngine>(settings,
                                              std::move(probe),
                                              notifications,
                                              m_apiFactory ? m_apiFactory : minifluxApiFactory());
    } catch (const StoreError &ex) {
        std::cerr << "Failed to open local state: " << ex.what() << "\n";
        return 1;
    }
    engine->start();

    if (command == QStringLiteral("status")) {
        return runStatus(*engine, args);
    }
    if (command == QStringLiteral("mark")) {
        return runMark(*engine, args);
    }
    if (command == QStringLiteral("mark-entries")) {
        return runMarkEntries(*engine, args);
    }
    if (command == QStringLiteral("mark-feed")) {
        return runMarkCollection(*engine, args, true);
    }
    if (command == QStringLiteral("mark-category")) {
        return runMarkCollection(*engine, args, false);
    }
    if (command == QStringLiteral("fetch")) {
        return runFetch(*engine, args);
    }
    if (command == QStringLiteral("queue")) {
        return runQueue(*engine, args);
    }
    if (command == QStringLiteral("sync")) {
        return runSync(*engine, args);
    }
    if (command == QStringLiteral("clear-queue")) {
        return runClearQueue(*engine, args);
    }
    if (command == QStringLiteral("purge")) {
        return runPurge(*engine, args);
    }
    if (command == QStringLiteral("counts")) {
        return runCounts(*engine);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int SyncCli::runStatus(SyncEngine &engine, const QStringList &args)
{
    const auto entryId = args.size() > 2 ? parseId(args.at(2)) : std::nullopt;
    if (!entryId) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    std::optional<EntityStatusRecord> record;
    try {
        record = engine.store().load(*entryId);
    } catch (const StoreError &ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }
    if (!record) {
        std::cerr << "Entry " << *entryId << " not found\n";
        return 1;
    }

    nlohmann::json payload = *record;
    const auto queued = engine.statusQueue().load();
    const auto it = queued.find(*entryId);
    if (it != queued.end()) {
        payload["queued"] = it->second;
    }
    std::cout << payload.dump(2) << std::endl;
    return 0;
}

int SyncCli::runMark(SyncEngine &engine, const QStringList &args)
{
    const auto entryId = args.size() > 3 ? parseId(args.at(2)) : std::nullopt;
    const auto status = args.size() > 3 ? parseTargetStatus(args.at(3)) : std::nullopt;
    if (!entryId || !status) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    StatusDispatcher &dispatcher = engine.dispatcher();
    const DispatchResult result = dispatcher.dispatch(*entryId, *status);
    std::cout << "entry " << *entryId << ": " << dispatchResultName(result) << "\n";

    if (result == DispatchResult::Dispatched) {
        bool synced = false;
        QMetaObject::Connection connection = QObject::connect(
            &dispatcher, &StatusDispatcher::dispatchSettled,
            [&synced](qint64, bool syncedRemotely) { synced = syncedRemotely; });
        const bool settled = waitForSignal(&dispatcher,
                                           &StatusDispatcher::dispatchSettled,
                                           engine.settings().totalTimeoutMs + 5000);
        QObject::disconnect(connection);
        std::cout << "entry " << *entryId << ": "
                  << (settled ? (synced ? "synced" : "queued") : "pending") << "\n";
    }

    return (result == DispatchResult::InvalidRequest
            || result == DispatchResult::LocalWriteFailed) ? 1 : 0;
}

int SyncCli::runMarkEntries(SyncEngine &engine, const QStringList &args)
{
    const auto status = args.size() > 3 ? parseTargetStatus(args.at(2)) : std::nullopt;
    if (!status) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    std::vector<int64_t> entryIds;
    for (int i = 3; i < args.size(); ++i) {
        const auto entryId = parseId(args.at(i));
        if (!entryId) {
            std::cerr << "Invalid entry id: " << args.at(i).toStdString() << "\n";
            return 1;
        }
        entryIds.push_back(*entryId);
    }

    MarkAsReadService &service = engine.markAsRead();
    if (!service.markEntries(entryIds, *status)) {
        return 1;
    }
    if (service.inFlightCount() > 0) {
        waitForSignal(&service, &MarkAsReadService::operationSettled,
                      engine.settings().totalTimeoutMs + 5000);
    }
    return 0;
}

int SyncCli::runMarkCollection(SyncEngine &engine, const QStringList &args, bool feed)
{
    const auto collectionId = args.size() > 2 ? parseId(args.at(2)) : std::nullopt;
    if (!collectionId) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    MarkAsReadService &service = engine.markAsRead();
    const bool accepted = feed ? service.markFeedAsRead(*collectionId)
                               : service.markCategoryAsRead(*collectionId);
    if (!accepted) {
        return 1;
    }
    if (service.inFlightCount() > 0) {
        waitForSignal(&service, &MarkAsReadService::operationSettled,
                      engine.settings().totalTimeoutMs + 5000);
    }
    return 0;
}

int SyncCli::runFetch(SyncEngine &engine, const QStringList &args)
{
    int limit = 100;
    const QString limitValue = getArgValue(args, QStringLiteral("--limit"));
    if (!limitValue.isEmpty()) {
        bool ok = false;
        limit = limitValue.toInt(&ok);
        if (!ok || limit <= 0) {
            std::cerr << usageText().toStdString();
            return 1;
        }
    }

    if (!engine.probe().isOnline()) {
        std::cerr << "Cannot fetch entries while offline\n";
        return 1;
    }

    int materialized = 0;
    QString error;
    QMetaObject::Connection connection = QObject::connect(
        &engine, &SyncEngine::entriesFetched,
        [&materialized, &error](int count, const QString &message) {
            materialized = count;
            error = message;
        });
    if (!engine.fetchUnreadEntries(limit)) {
        QObject::disconnect(connection);
        std::cerr << "Workers are not accepting requests\n";
        return 1;
    }
    const bool finished = waitForSignal(&engine, &SyncEngine::entriesFetched,
                                        engine.settings().totalTimeoutMs + 5000);
    QObject::disconnect(connection);

    if (!finished) {
        std::cerr << "Timed out waiting for entries\n";
        return 1;
    }
    if (!error.isEmpty()) {
        std::cerr << "Failed to fetch entries: " << error.toStdString() << "\n";
        return 1;
    }
    std::cout << "Materialized " << materialized << " entries\n";
    return 0;
}

int SyncCli::runQueue(SyncEngine &engine, const QStringList &args)
{
    const QString format = getArgValue(args, QStringLiteral("--format")).toLower();
    const QueueCounts counts = engine.coordinator().totalQueueCount();

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["counts"] = counts;
        nlohmann::json statuses = nlohmann::json::object();
        for (const auto &[entryId, entry] : engine.statusQueue().load()) {
            statuses[std::to_string(entryId)] = entry;
        }
        nlohmann::json feeds = nlohmann::json::object();
        for (const auto &[feedId, entry] : engine.feedQueue().load()) {
            feeds[std::to_string(feedId)] = entry;
        }
        nlohmann::json categories = nlohmann::json::object();
        for (const auto &[categoryId, entry] : engine.categoryQueue().load()) {
            categories[std::to_string(categoryId)] = entry;
        }
        payload["entryStatus"] = statuses;
        payload["feeds"] = feeds;
        payload["categories"] = categories;
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    std::cout << "Pending changes: " << counts.total() << "\n";
    std::cout << "  entry status: " << counts.entryStatus << "\n";
    std::cout << "  feeds:        " << counts.feeds << "\n";
    std::cout << "  categories:   " << counts.categories << "\n";
    for (const auto &[entryId, entry] : engine.statusQueue().load()) {
        std::cout << "  - entry " << entryId << ": "
                  << toStatusString(entry.originalStatus) << " -> "
                  << toStatusString(entry.targetStatus) << " (queued "
                  << toIso8601Utc(entry.timestamp) << ")\n";
    }
    return 0;
}

int SyncCli::runSync(SyncEngine &engine, const QStringList &args)
{
    const bool assumeYes = args.contains(QStringLiteral("--yes"));
    ConsolePrompt prompt(assumeYes, m_input ? *m_input : std::cin);

    SyncCoordinator &coordinator = engine.coordinator();
    SyncSummary summary;
    QMetaObject::Connection connection = QObject::connect(
        &coordinator, &SyncCoordinator::syncFinished,
        [&summary](const SyncSummary &result) { summary = result; });

    const std::size_t pending = coordinator.totalQueueCount().total();
    const bool started = coordinator.processAll(&prompt);
    bool finished = true;
    if (started) {
        const int budget = static_cast<int>(pending + 1) * engine.settings().totalTimeoutMs;
        finished = waitForSignal(&coordinator, &SyncCoordinator::syncFinished, budget);
    }
    QObject::disconnect(connection);

    if (!finished) {
        std::cerr << "Timed out waiting for sync to finish\n";
        return 1;
    }
    std::cout << nlohmann::json(summary).dump() << std::endl;
    return summary.failed > 0 ? 1 : 0;
}

int SyncCli::runClearQueue(SyncEngine &engine, const QStringList &args)
{
    const bool assumeYes = args.contains(QStringLiteral("--yes"));
    ConsolePrompt prompt(assumeYes, m_input ? *m_input : std::cin);
    return engine.coordinator().clearAll(prompt) ? 0 : 1;
}

int SyncCli::runPurge(SyncEngine &engine, const QStringList &args)
{
    const auto entryId = args.size() > 2 ? parseId(args.at(2)) : std::nullopt;
    if (!entryId) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    if (!engine.purgeEntry(*entryId)) {
        std::cerr << "Entry " << *entryId << " not found\n";
        return 1;
    }
    std::cout << "Purged entry " << *entryId << "\n";
    return 0;
}

int SyncCli::runCounts(SyncEngine &engine)
{
    QString countsJson;
    QString error;
    QMetaObject::Connection connection = QObject::connect(
        &engine, &SyncEngine::countsReady,
        [&countsJson, &error](const QString &json, const QString &message) {
            countsJson = json;
            error = message;
        });
    if (!engine.requestCounts()) {
        QObject::disconnect(connection);
        std::cerr << "Workers are not accepting requests\n";
        return 1;
    }
    const bool finished = waitForSignal(&engine, &SyncEngine::countsReady,
                                        3 * engine.settings().totalTimeoutMs + 5000);
    QObject::disconnect(connection);

    if (!finished) {
        std::cerr << "Timed out waiting for counts\n";
        return 1;
    }
    if (!error.isEmpty()) {
        std::cerr << "Failed to fetch counts: " << error.toStdString() << "\n";
    }
    std::cout << countsJson.toStdString() << std::endl;
    return error.isEmpty() ? 0 : 1;
}

std::optional<int64_t> SyncCli::parseId(const QString &value) const
{
    bool ok = false;
    const qlonglong parsed = value.toLongLong(&ok);
    if (!ok || !isValidEntityId(parsed)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(parsed);
}

} // namespace fluxsync
