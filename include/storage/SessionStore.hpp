#pragma once

#include "config/Config.hpp"
#include "storage/AdvisoryLock.hpp"
#include "storage/FileSystem.hpp"
#include "types/SessionIdentity.hpp"
#include "types/SessionMetadata.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace rh::concurrency { class TaskQueue; }

namespace rh::storage {

struct SessionRecord {
    std::string key;
    std::filesystem::path snapshotPath, metadataPath;
};

/**
 * Keyed on-disk cache of session snapshots.
 *
 * Every key owns two sibling files in the store directory: "{key}.snapshot"
 * (opaque bytes) and "{key}.meta.json". Writes go through *.tmp siblings and a
 * rename while holding the directory's advisory lock, so other processes
 * never read a half-written pair. Expired records are removed lazily, on the
 * store's own cleanup worker, the next time isValid() touches them.
 */
class SessionStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr const auto* SNAPSHOT_EXT = ".snapshot";
    static constexpr const auto* METADATA_EXT = ".meta.json";
    static constexpr const auto* TMP_EXT = ".tmp";

    explicit SessionStore(config::StoreConfig cfg,
                          std::shared_ptr<FileSystem> fs = std::make_shared<LocalFileSystem>(),
                          std::shared_ptr<AdvisoryLock> lock = std::make_shared<FileLock>(),
                          Clock clock = [] { return std::chrono::system_clock::now(); });

    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // Fails closed: any doubt about the record yields false.
    [[nodiscard]] bool isValid(const types::SessionIdentity& id) const;

    // Absolute snapshot path when isValid() holds.
    [[nodiscard]] std::optional<std::filesystem::path> load(const types::SessionIdentity& id) const;

    // Throws types::LockTimeout when the directory lock cannot be taken.
    void save(const types::SessionIdentity& id, const std::string& snapshot);

    // Idempotent. Never throws.
    void cleanup(const types::SessionIdentity& id) const;

    // nullopt when absent or unreadable.
    [[nodiscard]] std::optional<types::SessionMetadata> readMetadata(const types::SessionIdentity& id) const;

    [[nodiscard]] SessionRecord record(const types::SessionIdentity& id) const;
    [[nodiscard]] std::filesystem::path directory() const;

    // Blocks until every scheduled background cleanup has run.
    void waitForCleanup() const;

private:
    void cleanupKey(const SessionRecord& rec, bool onlyIfExpired) const;
    [[nodiscard]] bool stillExpired(const SessionRecord& rec) const;
    void scheduleCleanup(const SessionRecord& rec) const;

    config::StoreConfig cfg_;
    std::shared_ptr<FileSystem> fs_;
    std::shared_ptr<AdvisoryLock> lock_;
    Clock clock_;
    std::unique_ptr<concurrency::TaskQueue> cleanupQueue_;
};

}
