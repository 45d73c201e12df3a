#pragma once

#include <memory>
#include <optional>

#include <QByteArray>
#include <QString>
#include <QUrlQuery>

#include "remote/remote_api.hpp"

class QNetworkAccessManager;

namespace fluxsync {

/**
 * MinifluxApiClient speaks the Miniflux v1 REST API over
 * QNetworkAccessManager.
 *
 * Each request runs a local QEventLoop until the reply finishes, so an
 * instance must be created and used on a single thread (normally a worker
 * task). The total timeout and the cancellation token both abort the reply.
 */
class MinifluxApiClient : public RemoteApi
{
public:
    explicit MinifluxApiClient(ServerSettings settings, CancellationTokenPtr token = nullptr);
    ~MinifluxApiClient() override;

    ApiResult updateEntries(const std::vector<int64_t> &entryIds, EntryStatus status) override;
    ApiResult markFeedAsRead(int64_t feedId) override;
    ApiResult markCategoryAsRead(int64_t categoryId) override;
    ApiResult fetchEntries(const EntryQuery &query) override;
    ApiResult fetchFeedCounters() override;
    ApiResult fetchCategories(bool withCounts) override;

    // Server address without trailing slashes, plus "/v1".
    static QString baseUrl(const std::string &serverAddress);
    static std::string errorMessageFor(int httpStatus, const QByteArray &responseBody);

private:
    ApiResult request(const QByteArray &verb,
                      const QString &endpoint,
                      const QUrlQuery &query = QUrlQuery(),
                      const std::optional<nlohmann::json> &body = std::nullopt);

    ServerSettings m_settings;
    CancellationTokenPtr m_token;
    std::unique_ptr<QNetworkAccessManager> m_manager;
};

RemoteApiFactory minifluxApiFactory();

} // namespace fluxsync
