#include "storage/AdvisoryLock.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

using namespace rh::storage;
using namespace rh::types;

namespace {

class FlockHandle final : public LockHandle {
public:
    FlockHandle(const int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}

    ~FlockHandle() override { release(); }

    FlockHandle(const FlockHandle&) = delete;
    FlockHandle& operator=(const FlockHandle&) = delete;

    void release() override {
        if (fd_ < 0) return;
        if (::flock(fd_, LOCK_UN) != 0)
            rh::log::Registry::store()->warn("[FileLock] Unlock failed for {}: {}", path_.string(), std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_;
    std::filesystem::path path_;
};

}

std::unique_ptr<LockHandle> FileLock::acquire(const std::filesystem::path& dir, const RetryPolicy& policy) {
    const auto lockPath = dir / LOCK_FILE_NAME;

    const int fd = ::open(lockPath.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0)
        throw std::runtime_error("FileLock: open failed for " + lockPath.string() + ": " + std::strerror(errno));

    auto backoff = policy.min_backoff;
    for (unsigned int attempt = 0;; ++attempt) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) return std::make_unique<FlockHandle>(fd, lockPath);

        const int err = errno;
        if (err != EWOULDBLOCK && err != EINTR) {
            ::close(fd);
            throw std::runtime_error("FileLock: flock failed for " + lockPath.string() + ": " + std::strerror(err));
        }

        if (attempt >= policy.retries) break;

        log::Registry::store()->debug("[FileLock] {} busy, retry {}/{} in {}ms",
                                      lockPath.string(), attempt + 1, policy.retries, backoff.count());
        std::this_thread::sleep_for(backoff);
        backoff = std::min(backoff * 2, policy.max_backoff);
    }

    ::close(fd);
    throw LockTimeout("Could not acquire lock " + lockPath.string() + " after " +
                      std::to_string(policy.retries + 1) + " attempts");
}
