#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <QByteArray>
#include <QFile>
#include <QSaveFile>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"

namespace fluxsync {

inline constexpr int kQueueSchemaVersion = 1;

/**
 * DurableQueue keeps at most one pending operation per entity id in a
 * single JSON file.
 *
 * Every mutation re-reads the whole file, applies the change and writes it
 * back atomically through QSaveFile. An empty queue has no file at all, so
 * "nothing pending" is an existence check. A file that cannot be parsed, or
 * that belongs to another schema or queue kind, reads as empty.
 *
 * Entry must provide nlohmann to_json/from_json.
 */
template <typename Entry>
class DurableQueue
{
public:
    using Map = std::map<int64_t, Entry>;

    DurableQueue(QueueKind kind, std::filesystem::path path)
        : m_kind(kind)
        , m_path(std::move(path))
    {
    }

    DurableQueue(const DurableQueue &) = delete;
    DurableQueue &operator=(const DurableQueue &) = delete;

    Map load() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return loadUnlocked();
    }

    bool save(const Map &entries)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return saveUnlocked(entries);
    }

    // Overwrites any pending entry for the same id.
    bool enqueue(int64_t id, const Entry &entry)
    {
        if (!isValidEntityId(id)) {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        Map entries = loadUnlocked();
        entries[id] = entry;
        return saveUnlocked(entries);
    }

    // Same as enqueue() for many ids, in one read-modify-write.
    bool enqueueAll(const Map &additions)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Map entries = loadUnlocked();
        for (const auto &[id, entry] : additions) {
            if (isValidEntityId(id)) {
                entries[id] = entry;
            }
        }
        return saveUnlocked(entries);
    }

    // Removing an id that is not queued succeeds without touching the file.
    bool remove(int64_t id)
    {
        if (!isValidEntityId(id)) {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        Map entries = loadUnlocked();
        if (entries.erase(id) == 0) {
            return true;
        }
        return saveUnlocked(entries);
    }

    bool removeAll(const std::vector<int64_t> &ids)
    {
        return removeAll(ids, [](int64_t, const Entry &) { return true; });
    }

    // One read-modify-write for many ids. Only entries for which
    // shouldRemove(id, entry) holds are dropped, so an entry re-queued with
    // a different intent in the meantime survives.
    template <typename Predicate>
    bool removeAll(const std::vector<int64_t> &ids, Predicate shouldRemove)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Map entries = loadUnlocked();
        std::size_t erased = 0;
        for (int64_t id : ids) {
            const auto it = entries.find(id);
            if (it != entries.end() && shouldRemove(id, it->second)) {
                entries.erase(it);
                ++erased;
            }
        }
        if (erased == 0) {
            return true;
        }
        return saveUnlocked(entries);
    }

    bool clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return saveUnlocked(Map{});
    }

    std::size_t count() const
    {
        return load().size();
    }

    bool contains(int64_t id) const
    {
        const Map entries = load();
        return entries.find(id) != entries.end();
    }

    bool exists() const
    {
        std::error_code error;
        return std::filesystem::exists(m_path, error);
    }

    QueueKind kind() const
    {
        return m_kind;
    }

    const std::filesystem::path &path() const
    {
        return m_path;
    }

private:
    Map loadUnlocked() const
    {
        Map entries;
        if (!exists()) {
            return entries;
        }

        QFile file(QString::fromStdString(m_path.string()));
        if (!file.open(QIODevice::ReadOnly)) {
            reportCorruption("open_failed", file.errorString().toStdString());
            return entries;
        }
        const QByteArray bytes = file.readAll();

        try {
            const nlohmann::json root = nlohmann::json::parse(bytes.constData(),
                                                              bytes.constData() + bytes.size());
            if (!root.is_object()) {
                reportCorruption("not_an_object", std::string());
                return Map{};
            }
            if (root.value("schemaVersion", 0) != kQueueSchemaVersion) {
                reportCorruption("schema_mismatch", root.value("schemaVersion", nlohmann::json()).dump());
                return Map{};
            }
            if (root.value("queue", std::string()) != toQueueKindString(m_kind)) {
                reportCorruption("queue_kind_mismatch", root.value("queue", std::string()));
                return Map{};
            }
            for (const auto &item : root.at("entries").items()) {
                std::size_t consumed = 0;
                const int64_t id = std::stoll(item.key(), &consumed);
                if (consumed != item.key().size()) {
                    throw std::invalid_argument("trailing characters in queue id " + item.key());
                }
                if (!isValidEntityId(id)) {
                    continue;
                }
                entries[id] = item.value().template get<Entry>();
            }
        } catch (const nlohmann::json::exception &ex) {
            reportCorruption("parse_failed", ex.what());
            return Map{};
        } catch (const std::logic_error &ex) {
            // std::stoll and the strict enum parsers.
            reportCorruption("invalid_entry", ex.what());
            return Map{};
        }

        return entries;
    }

    bool saveUnlocked(const Map &entries)
    {
        std::error_code error;
        if (entries.empty()) {
            std::filesystem::remove(m_path, error);
            if (error) {
                reportWriteFailure("remove_failed", error.message());
                return false;
            }
            return true;
        }

        std::filesystem::create_directories(m_path.parent_path(), error);
        if (error) {
            reportWriteFailure("mkdir_failed", error.message());
            return false;
        }

        nlohmann::json items = nlohmann::json::object();
        for (const auto &[id, entry] : entries) {
            items[std::to_string(id)] = entry;
        }
        const nlohmann::json root{
            {"schemaVersion", kQueueSchemaVersion},
            {"queue", toQueueKindString(m_kind)},
            {"entries", items}
        };
        const std::string payload = root.dump(2);

        QSaveFile file(QString::fromStdString(m_path.string()));
        if (!file.open(QIODevice::WriteOnly)) {
            reportWriteFailure("open_failed", file.errorString().toStdString());
            return false;
        }
        const QByteArray bytes = QByteArray::fromStdString(payload);
        if (file.write(bytes) != bytes.size()) {
            reportWriteFailure("write_failed", file.errorString().toStdString());
            file.cancelWriting();
            return false;
        }
        if (!file.commit()) {
            reportWriteFailure("commit_failed", file.errorString().toStdString());
            return false;
        }
        return true;
    }

    void reportCorruption(const char *why, const std::string &detail) const
    {
        FSLOG_WARN(QStringLiteral("DurableQueue"),
                   QStringLiteral("load"),
                   QStringLiteral("queue_corrupt"),
                   QString::fromLatin1(why),
                   QStringLiteral("read_as_empty"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"queue", toQueueKindString(m_kind)},
                                   {"path", m_path.string()},
                                   {"detail", detail}}));
    }

    void reportWriteFailure(const char *why, const std::string &detail) const
    {
        FSLOG_ERROR(QStringLiteral("DurableQueue"),
                    QStringLiteral("save"),
                    QStringLiteral("queue_write_failed"),
                    QString::fromLatin1(why),
                    QStringLiteral("qsavefile"),
                    logging::defaultWho(),
                    logging::currentCorrelationId(),
                    (nlohmann::json{{"queue", toQueueKindString(m_kind)},
                                    {"path", m_path.string()},
                                    {"detail", detail}}));
    }

    QueueKind m_kind;
    std::filesystem::path m_path;
    mutable std::mutex m_mutex;
};

using EntryStatusQueue = DurableQueue<StatusQueueEntry>;
using CollectionQueue = DurableQueue<CollectionQueueEntry>;

} // namespace fluxsync
