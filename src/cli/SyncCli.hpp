#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>

#include <QString>
#include <QStringList>

#include "remote/remote_api.hpp"

namespace fluxsync {

class SyncEngine;

class SyncCli
{
public:
    // The factory is replaceable so the CLI can run against a stub server.
    explicit SyncCli(RemoteApiFactory apiFactory = RemoteApiFactory());

    // returns exit code
    int run(int argc, char *argv[]);

    void setInput(std::istream *input)
    {
        m_input = input;
    }

private:
    // Each subcommand drives the engine and waits on the event loop until
    // its asynchronous part has settled.
    int runStatus(SyncEngine &engine, const QStringList &args);
    int runMark(SyncEngine &engine, const QStringList &args);
    int runMarkEntries(SyncEngine &engine, const QStringList &args);
    int runMarkCollection(SyncEngine &engine, const QStringList &args, bool feed);
    int runFetch(SyncEngine &engine, const QStringList &args);
    int runQueue(SyncEngine &engine, const QStringList &args);
    int runSync(SyncEngine &engine, const QStringList &args);
    int runClearQueue(SyncEngine &engine, const QStringList &args);
    int runPurge(SyncEngine &engine, const QStringList &args);
    int runCounts(SyncEngine &engine);

    std::optional<int64_t> parseId(const QString &value) const;

    RemoteApiFactory m_apiFactory;
    std::istream *m_input = nullptr;
};

} // namespace fluxsync
