#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>

namespace rh::storage {

using RetryPolicy = config::LockConfig;

class LockHandle {
public:
    virtual ~LockHandle() = default;

    // Idempotent.
    virtual void release() = 0;
};

// Cooperative lock scoped to a directory. acquire() throws types::LockTimeout
// once the retry policy is exhausted.
class AdvisoryLock {
public:
    virtual ~AdvisoryLock() = default;

    [[nodiscard]] virtual std::unique_ptr<LockHandle> acquire(const std::filesystem::path& dir,
                                                              const RetryPolicy& policy) = 0;
};

// flock(2) on "<dir>/.rehydra.lock", created on demand.
class FileLock final : public AdvisoryLock {
public:
    static constexpr const auto* LOCK_FILE_NAME = ".rehydra.lock";

    [[nodiscard]] std::unique_ptr<LockHandle> acquire(const std::filesystem::path& dir,
                                                      const RetryPolicy& policy) override;
};

}
