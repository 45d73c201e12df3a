#pragma once

#include <filesystem>
#include <string>

namespace fluxsync {

// Frozen copy of everything a worker needs to talk to the server.
struct ServerSettings {
    std::string serverAddress;
    std::string apiToken;
    int connectTimeoutMs = 15000;
    int totalTimeoutMs = 30000;
};

struct Settings {
    std::string serverAddress;
    std::string apiToken;
    std::filesystem::path dataDir;

    int connectTimeoutMs = 15000;
    int totalTimeoutMs = 30000;
    int maxWorkers = 4;
    int reaperIntervalMs = 10000;
    // 0 means one batched call per target status.
    int batchSize = 0;

    std::string order = "published_at";
    std::string direction = "desc";

    bool autoSyncOnReconnect = true;
    bool cacheEnabled = true;
    int unreadCountTtlSeconds = 300;
    int feedCountersTtlSeconds = 60;
    int categoryCountsTtlSeconds = 300;

    ServerSettings serverSnapshot() const;
    bool hasServerCredentials() const;

    std::filesystem::path statusQueuePath() const;
    std::filesystem::path feedQueuePath() const;
    std::filesystem::path categoryQueuePath() const;
    std::filesystem::path databasePath() const;
};

std::filesystem::path defaultDataDir();
std::filesystem::path defaultConfigPath();

// Missing or malformed files yield defaults; environment overrides
// (FLUXSYNC_SERVER, FLUXSYNC_TOKEN, FLUXSYNC_DATA_DIR) are applied last.
Settings loadSettings(const std::filesystem::path &path = defaultConfigPath());
bool saveSettings(const Settings &settings,
                  const std::filesystem::path &path = defaultConfigPath());

} // namespace fluxsync
