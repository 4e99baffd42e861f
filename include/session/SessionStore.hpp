#pragma once
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "session/Session.hpp"

namespace reviewer {
namespace fs = std::filesystem;

class SessionStore;

enum class SortKey { LastUpdated, CreatedAt, Name, Iteration };

// "last_updated" | "created_at" | "name" | "iteration"; anything else throws InvalidArguments.
SortKey sort_key_from_string(const std::string& s);

/**
 * Exclusive right to run a review on one (name, project_root) session.
 * Holds the in-process slot and an advisory flock on the session's lock file;
 * both are released on destruction.
 */
class SessionLease {
public:
    SessionLease(SessionLease&& other) noexcept;
    SessionLease& operator=(SessionLease&& other) noexcept;
    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;
    ~SessionLease();

    const std::string& key() const { return key_; }
    void release();

private:
    friend class SessionStore;
    SessionLease(SessionStore* store, std::string key, int fd) : store_(store), key_(std::move(key)), fd_(fd) {}

    SessionStore* store_ = nullptr;
    std::string key_;
    int fd_ = -1;
};

/**
 * Durable session records, one JSON file per (name, canonical project_root).
 * Safe to share between threads; the lease serializes reviews of the same session,
 * including reviews running in other processes on the same directory.
 */
class SessionStore {
public:
    static constexpr int kFormatVersion = 1;

    explicit SessionStore(fs::path base_dir);

    // Throws InvalidArguments if the session already exists.
    Session create(const std::string& name, const std::string& project_root);

    // Throws NotFound, or IncompatibleRecord for unreadable/foreign-version records.
    Session load(const std::string& name, const std::string& project_root) const;
    std::optional<Session> find(const std::string& name, const std::string& project_root) const;

    void save(const Session& session);

    std::vector<SessionSummary> list(const std::optional<std::string>& project_filter = std::nullopt,
                                     size_t limit = 50, SortKey sort_by = SortKey::LastUpdated) const;

    // Returns false when no such session exists. Throws SessionBusy while a review holds it.
    bool remove(const std::string& name, const std::string& project_root);

    SessionLease acquire(const std::string& name, const std::string& project_root,
                         std::chrono::milliseconds wait);

    // Serialized form written to disk; stable for equal sessions.
    static std::string serialize(const Session& session);
    static std::string canonical_root(const std::string& project_root);

    const fs::path& base_dir() const { return base_dir_; }

private:
    friend class SessionLease;

    std::string key_for(const std::string& name, const std::string& canonical) const;
    fs::path record_path(const std::string& key) const;
    fs::path lock_path(const std::string& key) const;
    Session parse_record(const fs::path& path) const;
    void release(const std::string& key, int fd);

    fs::path base_dir_;
    std::mutex mutex_;
    std::condition_variable released_;
    std::set<std::string> held_;
};

} // namespace reviewer
