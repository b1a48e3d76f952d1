/*
 * safedl/src/queue/state_store.cpp
 *
 * Durable queue state:
 * - load: parse -> migrate (with backups) -> validate; corrupt documents are moved aside
 * - mutate: mutex + flock(<state>.lock), re-read when another process wrote, atomic replace
 * - progress: memory first, flushed at a bounded interval
 */

#include <safedl/core/atomic_file.h>
#include <safedl/core/file_lock.h>
#include <safedl/queue/state_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <system_error>

#include <sys/stat.h>
#include <unistd.h>

namespace safedl::queue {

namespace fs = std::filesystem;
using nlohmann::json;

StateStore::StateStore(fs::path statePath, std::chrono::milliseconds lockTimeout)
    : statePath_(std::move(statePath)), lockTimeout_(lockTimeout) {}

StateStore::~StateStore() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (pendingProgress_.empty())
        return;
    auto lock = core::FileLock::acquire(lockPath(), lockTimeout_);
    if (!lock) {
        spdlog::warn("Dropping unflushed progress for {}: {}", statePath_.string(),
                     lock.error().message);
        return;
    }
    if (auto r = reloadIfChangedLocked(); !r) {
        spdlog::warn("Dropping unflushed progress for {}: {}", statePath_.string(),
                     r.error().message);
        return;
    }
    if (auto r = writeLocked(state_); !r) {
        spdlog::warn("Failed to flush progress on close: {}", r.error().message);
    }
}

Result<std::unique_ptr<StateStore>> StateStore::open(const fs::path& statePath,
                                                     std::chrono::milliseconds lockTimeout) {
    std::error_code ec;
    if (!statePath.parent_path().empty()) {
        fs::create_directories(statePath.parent_path(), ec);
        if (ec) {
            return core::makeErrnoError(ec.value(), "Cannot create state directory",
                                        statePath.parent_path());
        }
    }

    std::unique_ptr<StateStore> store(new StateStore(statePath, lockTimeout));
    std::lock_guard<std::mutex> lk(store->mutex_);
    auto lock = core::FileLock::acquire(store->lockPath(), lockTimeout);
    if (!lock) {
        return lock.error();
    }
    if (auto r = store->loadLocked(); !r) {
        return r.error();
    }
    return store;
}

fs::path StateStore::lockPath() const {
    auto p = statePath_;
    p += ".lock";
    return p;
}

StateStore::Fingerprint StateStore::fingerprint() const {
    struct stat st{};
    if (::stat(statePath_.c_str(), &st) != 0) {
        return Fingerprint{};
    }
    Fingerprint fp;
    fp.exists = true;
    fp.size = static_cast<std::uintmax_t>(st.st_size);
    fp.mtimeNs = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1'000'000'000 +
                 static_cast<std::int64_t>(st.st_mtim.tv_nsec);
    fp.inode = static_cast<std::uint64_t>(st.st_ino);
    return fp;
}

void StateStore::removeStaleTempFiles() const {
    // Called with the file lock held: no writer can be mid-rename
    const std::string prefix = "." + statePath_.filename().string() + ".tmp.";
    std::error_code ec;
    const auto dir = statePath_.parent_path().empty() ? fs::path(".") : statePath_.parent_path();
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.rfind(prefix, 0) == 0) {
            std::error_code rmEc;
            if (fs::remove(it->path(), rmEc)) {
                spdlog::debug("Removed stale temp file {}", it->path().string());
            }
        }
    }
}

Result<void> StateStore::moveAsideCorrupt(const std::string& reason) {
    // "<name>.corrupt", or "<name>.corrupt.<n>" when an earlier copy is still there
    auto corruptPath = statePath_;
    corruptPath += ".corrupt";
    std::error_code ec;
    for (int n = 1; fs::exists(corruptPath, ec); ++n) {
        corruptPath = statePath_;
        corruptPath += ".corrupt." + std::to_string(n);
    }
    if (::rename(statePath_.c_str(), corruptPath.c_str()) != 0) {
        return core::makeErrnoError(errno, "Cannot move corrupt state aside", statePath_);
    }
    spdlog::error("Queue state {} is unreadable ({}); moved to {} and starting empty",
                  statePath_.string(), reason, corruptPath.string());
    report_.recoveredFromCorruption = true;
    report_.corruptPath = corruptPath;
    report_.corruptReason = reason;
    state_ = QueueState{};
    lastWritten_ = fingerprint();
    return Result<void>();
}

Result<void> StateStore::loadLocked() {
    removeStaleTempFiles();

    auto text = core::readFile(statePath_);
    if (!text) {
        if (text.error().code == ErrorCode::NotFound) {
            report_.createdNew = true;
            state_ = QueueState{};
            lastWritten_ = fingerprint();
            return Result<void>();
        }
        return text.error();
    }

    json doc;
    try {
        doc = json::parse(text.value());
    } catch (const json::parse_error& e) {
        return moveAsideCorrupt(e.what());
    }

    auto migrated = migrator_.migrate(doc, statePath_);
    if (!migrated) {
        if (migrated.error().code == ErrorCode::UpgradeRequired) {
            spdlog::error("{}", migrated.error().message);
            return migrated.error();
        }
        return moveAsideCorrupt(migrated.error().message);
    }
    report_.migrationsApplied = migrated.value().applied;
    report_.backups = migrated.value().backups;

    auto decoded = queueStateFromJson(doc);
    if (!decoded) {
        return moveAsideCorrupt(decoded.error().message);
    }
    state_ = std::move(decoded).value();
    bool dirty = !report_.migrationsApplied.empty();

    const auto now = std::chrono::system_clock::now();
    for (auto& item : state_.items) {
        if (item.inFlight()) {
            spdlog::info("Item {} was {} when the previous run stopped; re-queued", item.id,
                         statusToString(item.status));
            item.status = TransferStatus::Queued;
            item.updatedAt = now;
            report_.interruptedRecovered.push_back(item.id);
            dirty = true;
        }
    }

    if (dirty) {
        return writeLocked(state_);
    }
    lastWritten_ = fingerprint();
    return Result<void>();
}

Result<void> StateStore::reloadIfChangedLocked() {
    const auto current = fingerprint();
    if (current == lastWritten_) {
        return Result<void>();
    }

    const ItemId ourLastId = state_.lastAssignedId;
    QueueState reloaded;
    if (current.exists) {
        auto text = core::readFile(statePath_);
        if (!text) {
            return text.error();
        }
        json doc;
        try {
            doc = json::parse(text.value());
        } catch (const json::parse_error& e) {
            spdlog::warn("Queue state changed on disk but is unreadable ({}); keeping ours",
                         e.what());
            return Result<void>();
        }
        auto migrated = migrator_.migrate(doc, statePath_);
        if (!migrated) {
            if (migrated.error().code == ErrorCode::UpgradeRequired) {
                return migrated.error();
            }
            spdlog::warn("Queue state changed on disk but cannot be migrated ({}); keeping ours",
                         migrated.error().message);
            return Result<void>();
        }
        auto decoded = queueStateFromJson(doc);
        if (!decoded) {
            spdlog::warn("Queue state changed on disk but is invalid ({}); keeping ours",
                         decoded.error().message);
            return Result<void>();
        }
        reloaded = std::move(decoded).value();
    }
    spdlog::debug("Queue state {} changed on disk; reloaded", statePath_.string());

    reloaded.lastAssignedId = std::max(reloaded.lastAssignedId, ourLastId);
    for (const auto& [id, progress] : pendingProgress_) {
        if (auto* item = reloaded.find(id)) {
            item->bytesTransferred = progress.first;
            item->totalBytes = progress.second;
        }
    }
    state_ = std::move(reloaded);
    lastWritten_ = current;
    return Result<void>();
}

Result<void> StateStore::writeLocked(const QueueState& state) {
    if (auto r = core::atomicWriteFile(statePath_, serialize(state)); !r) {
        return r;
    }
    lastWritten_ = fingerprint();
    pendingProgress_.clear();
    lastFlush_ = std::chrono::steady_clock::now();
    return Result<void>();
}

QueueState StateStore::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

std::optional<DownloadItem> StateStore::get(ItemId id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (const auto* item = state_.find(id)) {
        return *item;
    }
    return std::nullopt;
}

Result<void> StateStore::update(const Mutation& mutate) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto lock = core::FileLock::acquire(lockPath(), lockTimeout_);
    if (!lock) {
        return lock.error();
    }
    if (auto r = reloadIfChangedLocked(); !r) {
        return r;
    }

    QueueState next = state_;
    if (mutate) {
        if (auto r = mutate(next); !r) {
            return r;
        }
    }
    if (auto r = writeLocked(next); !r) {
        return r;
    }
    state_ = std::move(next);
    return Result<void>();
}

bool StateStore::recordProgress(ItemId id, std::int64_t bytesTransferred,
                                std::int64_t totalBytes) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto* item = state_.find(id);
    if (!item) {
        return false;
    }
    item->bytesTransferred = bytesTransferred;
    item->totalBytes = totalBytes;
    pendingProgress_[id] = {bytesTransferred, totalBytes};
    return true;
}

Result<void> StateStore::flushIfDue(std::chrono::milliseconds interval) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (pendingProgress_.empty() ||
            std::chrono::steady_clock::now() - lastFlush_ < interval) {
            return Result<void>();
        }
    }
    return flush();
}

Result<void> StateStore::flush() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (pendingProgress_.empty()) {
            return Result<void>();
        }
    }
    return update(nullptr);
}

Result<void> StateStore::destroy() {
    std::lock_guard<std::mutex> lk(mutex_);
    auto lock = core::FileLock::acquire(lockPath(), lockTimeout_);
    if (!lock) {
        return lock.error();
    }
    if (::unlink(statePath_.c_str()) != 0 && errno != ENOENT) {
        return core::makeErrnoError(errno, "Failed to delete state document", statePath_);
    }
    if (auto r = core::fsyncDirectory(statePath_.parent_path()); !r) {
        spdlog::debug("fsync on directory failed (continuing): {}", r.error().message);
    }

    const ItemId lastId = state_.lastAssignedId;
    state_ = QueueState{};
    state_.lastAssignedId = lastId;
    pendingProgress_.clear();
    lastWritten_ = fingerprint();
    spdlog::info("Queue state {} purged", statePath_.string());
    return Result<void>();
}

} // namespace safedl::queue
