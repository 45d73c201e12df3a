#include "common/config.hpp"

#include <QByteArray>
#include <QFile>
#include <QSaveFile>

#include <algorithm>
#include <cstdlib>
#include <system_error>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace fluxsync {

namespace {

std::filesystem::path homeDir()
{
    const char *home = std::getenv("HOME");
    return home ? std::filesystem::path(home) : std::filesystem::path(".");
}

void applyEnvironment(Settings &settings)
{
    const QString server = qEnvironmentVariable("FLUXSYNC_SERVER");
    if (!server.isEmpty()) {
        settings.serverAddress = server.toStdString();
    }
    const QString token = qEnvironmentVariable("FLUXSYNC_TOKEN");
    if (!token.isEmpty()) {
        settings.apiToken = token.toStdString();
    }
    const QString dataDir = qEnvironmentVariable("FLUXSYNC_DATA_DIR");
    if (!dataDir.isEmpty()) {
        settings.dataDir = dataDir.toStdString();
    }
}

int positiveOr(const nlohmann::json &j, const char *key, int fallback)
{
    const int value = j.value(key, fallback);
    return value > 0 ? value : fallback;
}

} // namespace

ServerSettings Settings::serverSnapshot() const
{
    ServerSettings snapshot;
    snapshot.serverAddress = serverAddress;
    snapshot.apiToken = apiToken;
    snapshot.connectTimeoutMs = connectTimeoutMs;
    snapshot.totalTimeoutMs = totalTimeoutMs;
    return snapshot;
}

bool Settings::hasServerCredentials() const
{
    return !serverAddress.empty() && !apiToken.empty();
}

std::filesystem::path Settings::statusQueuePath() const
{
    return dataDir / "status_queue.json";
}

std::filesystem::path Settings::feedQueuePath() const
{
    return dataDir / "feed_queue.json";
}

std::filesystem::path Settings::categoryQueuePath() const
{
    return dataDir / "category_queue.json";
}

std::filesystem::path Settings::databasePath() const
{
    return dataDir / "entries.db";
}

std::filesystem::path defaultDataDir()
{
    return homeDir() / ".local/share/fluxsync";
}

std::filesystem::path defaultConfigPath()
{
    return homeDir() / ".config/fluxsync/config.json";
}

Settings loadSettings(const std::filesystem::path &path)
{
    Settings settings;
    settings.dataDir = defaultDataDir();

    QFile file(QString::fromStdString(path.string()));
    if (file.exists() && file.open(QIODevice::ReadOnly)) {
        const QByteArray data = file.readAll();
        std::string malformedReason;
        try {
            const nlohmann::json j = nlohmann::json::parse(data.toStdString());
            if (!j.is_object()) {
                malformedReason = "config root is not an object";
            } else {
                settings.serverAddress = j.value("serverAddress", "");
                settings.apiToken = j.value("apiToken", "");
                const std::string dataDir = j.value("dataDir", "");
                if (!dataDir.empty()) {
                    settings.dataDir = dataDir;
                }
                settings.connectTimeoutMs = positiveOr(j, "connectTimeoutMs", settings.connectTimeoutMs);
                settings.totalTimeoutMs = positiveOr(j, "totalTimeoutMs", settings.totalTimeoutMs);
                settings.maxWorkers = positiveOr(j, "maxWorkers", settings.maxWorkers);
                settings.reaperIntervalMs = positiveOr(j, "reaperIntervalMs", settings.reaperIntervalMs);
                settings.batchSize = std::max(0, j.value("batchSize", 0));
                settings.order = j.value("order", settings.order);
                settings.direction = j.value("direction", settings.direction);
                settings.autoSyncOnReconnect = j.value("autoSyncOnReconnect", true);
                settings.cacheEnabled = j.value("cacheEnabled", true);
                settings.unreadCountTtlSeconds =
                    positiveOr(j, "unreadCountTtlSeconds", settings.unreadCountTtlSeconds);
                settings.feedCountersTtlSeconds =
                    positiveOr(j, "feedCountersTtlSeconds", settings.feedCountersTtlSeconds);
                settings.categoryCountsTtlSeconds =
                    positiveOr(j, "categoryCountsTtlSeconds", settings.categoryCountsTtlSeconds);
            }
        } catch (const nlohmann::json::exception &error) {
            malformedReason = error.what();
        }

        if (!malformedReason.empty()) {
            FSLOG_WARN(QStringLiteral("Config"),
                       QStringLiteral("loadSettings"),
                       QStringLiteral("config_malformed"),
                       QStringLiteral("parse_error"),
                       QStringLiteral("use_defaults"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"path", path.string()},
                                       {"error", malformedReason}}));
            settings = Settings{};
            settings.dataDir = defaultDataDir();
        }
    }

    applyEnvironment(settings);
    return settings;
}

bool saveSettings(const Settings &settings, const std::filesystem::path &path)
{
    std::error_code error;
    std::filesystem::create_directories(path.parent_path(), error);
    if (error) {
        return false;
    }

    const nlohmann::json j = {
        {"serverAddress", settings.serverAddress},
        {"apiToken", settings.apiToken},
        {"dataDir", settings.dataDir.string()},
        {"connectTimeoutMs", settings.connectTimeoutMs},
        {"totalTimeoutMs", settings.totalTimeoutMs},
        {"maxWorkers", settings.maxWorkers},
        {"reaperIntervalMs", settings.reaperIntervalMs},
        {"batchSize", settings.batchSize},
        {"order", settings.order},
        {"direction", settings.direction},
        {"autoSyncOnReconnect", settings.autoSyncOnReconnect},
        {"cacheEnabled", settings.cacheEnabled},
        {"unreadCountTtlSeconds", settings.unreadCountTtlSeconds},
        {"feedCountersTtlSeconds", settings.feedCountersTtlSeconds},
        {"categoryCountsTtlSeconds", settings.categoryCountsTtlSeconds}
    };

    QSaveFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(j.dump(2));
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        return false;
    }
    return file.commit();
}

} // namespace fluxsync
