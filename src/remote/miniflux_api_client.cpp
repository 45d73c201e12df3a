#include "remote/miniflux_api_client.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include "common/fluxsync_version.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace fluxsync {

namespace {

constexpr int kCancelPollIntervalMs = 25;

bool isSuccessStatus(int httpStatus)
{
    return httpStatus == 200 || httpStatus == 201 || httpStatus == 204;
}

} // namespace

MinifluxApiClient::MinifluxApiClient(ServerSettings settings, CancellationTokenPtr token)
    : m_settings(std::move(settings))
    , m_token(std::move(token))
    , m_manager(std::make_unique<QNetworkAccessManager>())
{
}

MinifluxApiClient::~MinifluxApiClient() = default;

QString MinifluxApiClient::baseUrl(const std::string &serverAddress)
{
    QString base = QString::fromStdString(serverAddress);
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    return base + QStringLiteral("/v1");
}

std::string MinifluxApiClient::errorMessageFor(int httpStatus, const QByteArray &responseBody)
{
    if (!responseBody.isEmpty()) {
        const nlohmann::json parsed = nlohmann::json::parse(responseBody.constData(),
                                                            responseBody.constData() + responseBody.size(),
                                                            nullptr,
                                                            false);
        if (parsed.is_object() && parsed.contains("error_message")
            && parsed.at("error_message").is_string()) {
            return parsed.at("error_message").get<std::string>();
        }
    }

    switch (httpStatus) {
    case 400:
        return "Bad request";
    case 401:
        return "Unauthorized - please check your API token";
    case 403:
        return "Forbidden - access denied";
    case 500:
        return "Internal server error";
    default:
        return "HTTP error: " + std::to_string(httpStatus);
    }
}

ApiResult MinifluxApiClient::updateEntries(const std::vector<int64_t> &entryIds, EntryStatus status)
{
    if (entryIds.empty()) {
        return ApiResult::success(204);
    }
    const nlohmann::json body{
        {"entry_ids", entryIds},
        {"status", toStatusString(status)}
    };
    return request("PUT", QStringLiteral("/entries"), QUrlQuery(), body);
}

ApiResult MinifluxApiClient::markFeedAsRead(int64_t feedId)
{
    return request("PUT", QStringLiteral("/feeds/%1/mark-all-as-read").arg(feedId));
}

ApiResult MinifluxApiClient::markCategoryAsRead(int64_t categoryId)
{
    return request("PUT", QStringLiteral("/categories/%1/mark-all-as-read").arg(categoryId));
}

ApiResult MinifluxApiClient::fetchEntries(const EntryQuery &query)
{
    QUrlQuery params;
    if (query.status) {
        params.addQueryItem(QStringLiteral("status"),
                            QString::fromStdString(toStatusString(*query.status)));
    }
    if (!query.order.empty()) {
        params.addQueryItem(QStringLiteral("order"), QString::fromStdString(query.order));
    }
    if (!query.direction.empty()) {
        params.addQueryItem(QStringLiteral("direction"), QString::fromStdString(query.direction));
    }
    if (query.limit > 0) {
        params.addQueryItem(QStringLiteral("limit"), QString::number(query.limit));
    }
    if (query.feedId > 0) {
        params.addQueryItem(QStringLiteral("feed_id"), QString::number(query.feedId));
    }
    if (query.categoryId > 0) {
        params.addQueryItem(QStringLiteral("category_id"), QString::number(query.categoryId));
    }
    return request("GET", QStringLiteral("/entries"), params);
}

ApiResult MinifluxApiClient::fetchFeedCounters()
{
    return request("GET", QStringLiteral("/feeds/counters"));
}

ApiResult MinifluxApiClient::fetchCategories(bool withCounts)
{
    QUrlQuery params;
    if (withCounts) {
        params.addQueryItem(QStringLiteral("counts"), QStringLiteral("true"));
    }
    return request("GET", QStringLiteral("/categories"), params);
}

ApiResult MinifluxApiClient::request(const QByteArray &verb,
                                     const QString &endpoint,
                                     const QUrlQuery &query,
                                     const std::optional<nlohmann::json> &body)
{
    if (m_settings.serverAddress.empty() || m_settings.apiToken.empty()) {
        return ApiResult::failure("Server address and API token must be configured");
    }
    if (m_token && m_token->isCancelled()) {
        ApiResult result = ApiResult::failure("Request cancelled");
        result.cancelled = true;
        return result;
    }

    QUrl url(baseUrl(m_settings.serverAddress) + endpoint);
    if (!query.isEmpty()) {
        url.setQuery(query);
    }

    QNetworkRequest networkRequest(url);
    networkRequest.setRawHeader("X-Auth-Token", QByteArray::fromStdString(m_settings.apiToken));
    networkRequest.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    networkRequest.setHeader(QNetworkRequest::UserAgentHeader,
                             QStringLiteral("fluxsync/%1").arg(QString::fromLatin1(FLUXSYNC_VERSION)));
    // Inactivity timeout; the total deadline is enforced below.
    networkRequest.setTransferTimeout(m_settings.connectTimeoutMs);

    const QByteArray payload = body ? QByteArray::fromStdString(body->dump()) : QByteArray();
    std::unique_ptr<QNetworkReply> reply(m_manager->sendCustomRequest(networkRequest, verb, payload));

    bool timedOut = false;
    bool cancelled = false;

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(&deadline, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
    });

    QTimer cancelPoll;
    cancelPoll.setInterval(kCancelPollIntervalMs);
    QObject::connect(&cancelPoll, &QTimer::timeout, &loop, [&]() {
        if (m_token && m_token->isCancelled()) {
            cancelled = true;
            reply->abort();
        }
    });

    if (!reply->isFinished()) {
        deadline.start(m_settings.totalTimeoutMs);
        if (m_token) {
            cancelPoll.start();
        }
        loop.exec();
    }
    deadline.stop();
    cancelPoll.stop();

    const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray responseBody = reply->readAll();
    const QNetworkReply::NetworkError networkError = reply->error();

    if (networkError == QNetworkReply::TimeoutError
        || (networkError == QNetworkReply::OperationCanceledError && !cancelled)) {
        timedOut = true;
    }

    FSLOG_DEBUG(QStringLiteral("MinifluxApiClient"),
                QStringLiteral("request"),
                QStringLiteral("http_request_finished"),
                QStringLiteral("remote_call"),
                QStringLiteral("qnetworkaccessmanager"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{{"method", verb.toStdString()},
                                {"endpoint", endpoint.toStdString()},
                                {"httpStatus", httpStatus},
                                {"networkError", static_cast<int>(networkError)}}));

    if (cancelled) {
        ApiResult result = ApiResult::failure("Request cancelled");
        result.cancelled = true;
        return result;
    }
    if (timedOut) {
        ApiResult result = ApiResult::failure("Request timed out");
        result.timedOut = true;
        return result;
    }
    if (httpStatus == 0) {
        FSLOG_WARN(QStringLiteral("MinifluxApiClient"),
                   QStringLiteral("request"),
                   QStringLiteral("network_error"),
                   QStringLiteral("no_response"),
                   QStringLiteral("qnetworkaccessmanager"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"endpoint", endpoint.toStdString()},
                                   {"error", reply->errorString().toStdString()}}));
        return ApiResult::failure("Network error occurred");
    }

    if (isSuccessStatus(httpStatus)) {
        if (responseBody.trimmed().isEmpty()) {
            return ApiResult::success(httpStatus);
        }
        nlohmann::json parsed = nlohmann::json::parse(responseBody.constData(),
                                                      responseBody.constData() + responseBody.size(),
                                                      nullptr,
                                                      false);
        if (parsed.is_discarded()) {
            return ApiResult::failure("Invalid JSON response from server", httpStatus);
        }
        return ApiResult::success(httpStatus, std::move(parsed));
    }

    const std::string message = errorMessageFor(httpStatus, responseBody);
    FSLOG_WARN(QStringLiteral("MinifluxApiClient"),
               QStringLiteral("request"),
               QStringLiteral("api_error"),
               QStringLiteral("http_status"),
               QStringLiteral("qnetworkaccessmanager"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"endpoint", endpoint.toStdString()},
                               {"httpStatus", httpStatus},
                               {"message", message}}));
    return ApiResult::failure(message, httpStatus);
}

RemoteApiFactory minifluxApiFactory()
{
    return [](const ServerSettings &settings, CancellationTokenPtr token) -> std::unique_ptr<RemoteApi> {
        return std::make_unique<MinifluxApiClient>(settings, std::move(token));
    };
}

} // namespace fluxsync
