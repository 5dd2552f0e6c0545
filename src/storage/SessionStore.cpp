#include "storage/SessionStore.hpp"
#include "concurrency/TaskQueue.hpp"
#include "identity/KeyDeriver.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <system_error>

using namespace rh::storage;
using namespace rh::types;
using namespace rh::log;
namespace fs = std::filesystem;

namespace {

fs::path tmpSibling(const fs::path& p) {
    return fs::path(p.string() + SessionStore::TMP_EXT);
}

std::string describe(const SessionIdentity& id) {
    return "kind=" + to_string(id.kind) + ", identity=" + id.identity;
}

}

SessionStore::SessionStore(config::StoreConfig cfg,
                           std::shared_ptr<FileSystem> fs,
                           std::shared_ptr<AdvisoryLock> lock,
                           Clock clock)
    : cfg_(std::move(cfg)),
      fs_(std::move(fs)),
      lock_(std::move(lock)),
      clock_(std::move(clock)),
      cleanupQueue_(std::make_unique<concurrency::TaskQueue>("store-cleanup")) {
    if (!fs_ || !lock_ || !clock_) throw std::invalid_argument("SessionStore requires a filesystem, a lock and a clock");
}

SessionStore::~SessionStore() {
    cleanupQueue_->shutdown();
}

SessionRecord SessionStore::record(const SessionIdentity& id) const {
    const auto key = identity::deriveKey(id.kind, id.identity);
    const auto dir = directory();
    return {key, dir / (key + SNAPSHOT_EXT), dir / (key + METADATA_EXT)};
}

fs::path SessionStore::directory() const {
    return cfg_.directory.is_absolute() ? cfg_.directory : fs::absolute(cfg_.directory);
}

bool SessionStore::isValid(const SessionIdentity& id) const {
    try {
        const auto rec = record(id);

        if (!fs_->exists(rec.snapshotPath) || !fs_->exists(rec.metadataPath)) {
            Registry::store()->debug("[SessionStore] No stored session for {} (key {}). "
                                     "Expected on first run or after cleanup.", describe(id), rec.key);
            return false;
        }

        const auto content = fs_->readFile(rec.metadataPath);
        if (!content) {
            Registry::store()->debug("[SessionStore] Metadata vanished for {} (key {})", describe(id), rec.key);
            return false;
        }

        if (content->empty()) {
            Registry::store()->warn("[SessionStore] Metadata file is empty: {}", rec.metadataPath.string());
            return false;
        }

        SessionMetadata meta;
        try {
            meta = nlohmann::json::parse(*content).get<SessionMetadata>();
        } catch (const std::exception& e) {
            // left in place for inspection
            Registry::store()->warn("[SessionStore] Failed to parse metadata file {}: {}", rec.metadataPath.string(), e.what());
            return false;
        }

        if (clock_() > meta.expiresAt) {
            Registry::store()->debug("[SessionStore] Session {} expired at {}, scheduling cleanup",
                                     rec.key, util::toIso8601(meta.expiresAt));
            scheduleCleanup(rec);
            return false;
        }

        return true;
    } catch (const std::exception& e) {
        Registry::store()->warn("[SessionStore] Unexpected error while checking session validity for {}: {}",
                                describe(id), e.what());
        return false;
    }
}

std::optional<fs::path> SessionStore::load(const SessionIdentity& id) const {
    if (!isValid(id)) return std::nullopt;
    return record(id).snapshotPath;
}

void SessionStore::save(const SessionIdentity& id, const std::string& snapshot) {
    const auto rec = record(id);
    const auto dir = directory();
    const auto tmpSnapshot = tmpSibling(rec.snapshotPath);
    const auto tmpMetadata = tmpSibling(rec.metadataPath);

    try {
        fs_->ensureDir(dir);

        const auto handle = lock_->acquire(dir, cfg_.lock);

        try {
            const auto now = clock_();
            const SessionMetadata meta{now, now + cfg_.expiry, id.kind, id.identity};

            fs_->writeFile(tmpSnapshot, snapshot);
            fs_->writeFile(tmpMetadata, nlohmann::json(meta).dump(2));

            fs_->rename(tmpSnapshot, rec.snapshotPath);
            fs_->rename(tmpMetadata, rec.metadataPath);
        } catch (...) {
            for (const auto& tmp : {tmpSnapshot, tmpMetadata}) {
                try {
                    fs_->remove(tmp);
                } catch (const std::exception& e) {
                    Registry::store()->warn("[SessionStore] Could not remove temp file {}: {}", tmp.string(), e.what());
                }
            }
            throw;
        }

        handle->release();
        Registry::store()->debug("[SessionStore] Session saved: {}", rec.snapshotPath.string());
    } catch (const std::exception& e) {
        Registry::store()->error("[SessionStore] Failed to save session {}: {}", rec.snapshotPath.string(), e.what());
        throw;
    }
}

void SessionStore::cleanup(const SessionIdentity& id) const {
    cleanupKey(record(id), false);
}

std::optional<SessionMetadata> SessionStore::readMetadata(const SessionIdentity& id) const {
    const auto rec = record(id);
    try {
        const auto content = fs_->readFile(rec.metadataPath);
        if (!content || content->empty()) return std::nullopt;
        return nlohmann::json::parse(*content).get<SessionMetadata>();
    } catch (const std::exception& e) {
        Registry::store()->warn("[SessionStore] Unreadable metadata {}: {}", rec.metadataPath.string(), e.what());
        return std::nullopt;
    }
}

void SessionStore::waitForCleanup() const {
    cleanupQueue_->waitIdle();
}

void SessionStore::scheduleCleanup(const SessionRecord& rec) const {
    const auto enqueued = cleanupQueue_->enqueue([this, rec] { cleanupKey(rec, true); }, "cleanup " + rec.key);
    if (!enqueued) Registry::store()->debug("[SessionStore] Cleanup of {} not scheduled, store is shutting down", rec.key);
}

bool SessionStore::stillExpired(const SessionRecord& rec) const {
    const auto content = fs_->readFile(rec.metadataPath);
    if (!content || content->empty()) return true;
    return clock_() > nlohmann::json::parse(*content).get<SessionMetadata>().expiresAt;
}

void SessionStore::cleanupKey(const SessionRecord& rec, const bool onlyIfExpired) const {
    try {
        // Already removed, possibly by another worker.
        if (!fs_->exists(rec.snapshotPath) && !fs_->exists(rec.metadataPath)) return;

        const auto handle = lock_->acquire(directory(), cfg_.lock);

        // A save may have landed between the expiry check and now.
        if (onlyIfExpired && !stillExpired(rec)) {
            Registry::store()->debug("[SessionStore] {} was refreshed before cleanup ran, keeping it", rec.key);
            return;
        }

        const bool removedSnapshot = fs_->remove(rec.snapshotPath);
        const bool removedMetadata = fs_->remove(rec.metadataPath);
        handle->release();
        if (removedSnapshot || removedMetadata)
            Registry::store()->debug("[SessionStore] Cleaned up session: {}", rec.key);
    } catch (const fs::filesystem_error& e) {
        if (e.code() != std::errc::no_such_file_or_directory)
            Registry::store()->warn("[SessionStore] Failed to clean up session files {}: {}", rec.key, e.what());
    } catch (const std::exception& e) {
        Registry::store()->warn("[SessionStore] Failed to clean up session files {}: {}", rec.key, e.what());
    }
}
