#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QUuid>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace fluxsync::logging {

namespace {

constexpr qint64 kRotateAtBytes = 5 * 1024 * 1024;
constexpr const char *kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

// Process-wide sink state. Every field is guarded by mutex.
struct SinkState {
    std::mutex mutex;
    QString processName;
    bool trace = false;
    QString who;
};

SinkState &sink()
{
    static SinkState state;
    return state;
}

thread_local QString t_corrId;

QString lookupWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

// Resolved on every write so a HOME redirected after start-up is honoured.
QString logsDir()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString relative = QStringLiteral(".local/share/fluxsync/logs");
    return home.isEmpty() ? relative : home + QLatin1Char('/') + relative;
}

void appendLine(const QString &dir, const QString &fileName, const QByteArray &line)
{
    QDir().mkpath(dir);
    const QString path = dir + QLatin1Char('/') + fileName;

    if (QFileInfo(path).size() >= kRotateAtBytes) {
        const QString previous = path + QStringLiteral(".1");
        QFile::remove(previous);
        QFile::rename(path, previous);
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    const bool traceFromEnv = qEnvironmentVariableIntValue("FLUXSYNC_TRACE") == 1;
    const QString who = lookupWho();

    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.processName = processName;
    state.trace = traceEnabled || traceFromEnv;
    state.who = who;
}

bool isTraceEnabled()
{
    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.trace;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

QString newCorrelationId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        SinkState &state = sink();
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.processName.isEmpty()) {
            return state.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("fluxsync");
}

QString defaultWho()
{
    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.who.isEmpty()) {
        state.who = lookupWho();
    }
    return state.who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString corr = correlationId.isEmpty() ? t_corrId : correlationId;
    const QString thread = QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);

    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", kLevelNames[static_cast<int>(level)]},
        {"process", process.toStdString()},
        {"thread", thread.toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(payload.dump());
    const QString dir = logsDir();

    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (level != LogLevel::Debug || state.trace) {
        appendLine(dir, process + QStringLiteral(".log"), line);
    }
    if (state.trace) {
        appendLine(dir, process + QStringLiteral("-trace.log"), line);
    }
}

} // namespace fluxsync::logging
