#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace fluxsync {

// Raised for any local persistence failure. The optimistic update that
// triggered it must be treated as not having happened.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class EntryNotFoundError : public StoreError {
public:
    explicit EntryNotFoundError(int64_t entryId);

    int64_t entryId() const { return m_entryId; }

private:
    int64_t m_entryId;
};

struct WriteOptions {
    // Marks the write as an automatic revert performed for a worker.
    bool viaWorker = false;
    // Skip the write when the record was modified after this point.
    std::optional<std::chrono::system_clock::time_point> unchangedSince;
};

// EntryStatusStore is the SQLite access layer for per-entry status records.
// Each write is a single read-modify-write transaction.
class EntryStatusStore {
public:
    explicit EntryStatusStore(const std::filesystem::path &dbPath);
    ~EntryStatusStore();

    EntryStatusStore(const EntryStatusStore &) = delete;
    EntryStatusStore &operator=(const EntryStatusStore &) = delete;

    std::optional<EntityStatusRecord> load(int64_t entryId) const;

    // Returns false when the write was skipped because of unchangedSince.
    // Throws EntryNotFoundError when no record exists, StoreError on I/O failure.
    bool write(int64_t entryId, EntryStatus status, const WriteOptions &options = {});

    // Create or refresh a record for an entry that became available locally.
    void materialize(const EntityStatusRecord &record);

    bool purge(int64_t entryId);

    std::vector<EntityStatusRecord> list() const;
    std::size_t count() const;

    bool integrityCheck(std::string *message) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace fluxsync
