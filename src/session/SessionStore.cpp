#include "session/SessionStore.hpp"
#include "session/AtomicFile.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace reviewer {

using json = nlohmann::json;

namespace {

constexpr auto kLockPoll = std::chrono::milliseconds(25);

std::string fnv1a64_hex(const std::string& data) {
    uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    static const char* digits = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[i] = digits[hash & 0xF];
        hash >>= 4;
    }
    return out;
}

} // namespace

SortKey sort_key_from_string(const std::string& s) {
    if (s.empty() || s == "last_updated") return SortKey::LastUpdated;
    if (s == "created_at") return SortKey::CreatedAt;
    if (s == "name") return SortKey::Name;
    if (s == "iteration") return SortKey::Iteration;
    throw ReviewerError(ErrorCode::InvalidArguments,
                        "sort_by must be one of last_updated, created_at, name, iteration (got '" + s + "')");
}

// --- 1. LEASE ---

SessionLease::SessionLease(SessionLease&& other) noexcept
    : store_(other.store_), key_(std::move(other.key_)), fd_(other.fd_) {
    other.store_ = nullptr;
    other.fd_ = -1;
}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        release();
        store_ = other.store_;
        key_ = std::move(other.key_);
        fd_ = other.fd_;
        other.store_ = nullptr;
        other.fd_ = -1;
    }
    return *this;
}

SessionLease::~SessionLease() { release(); }

void SessionLease::release() {
    if (!store_) return;
    store_->release(key_, fd_);
    store_ = nullptr;
    fd_ = -1;
}

// --- 2. STORE ---

SessionStore::SessionStore(fs::path base_dir) : base_dir_(std::move(base_dir)) {
    std::error_code ec;
    fs::create_directories(base_dir_, ec);
    if (ec) {
        throw ReviewerError(ErrorCode::IoError, "Cannot create session directory " + base_dir_.string() + ": " + ec.message());
    }
    spdlog::info("💾 Session store at {}", base_dir_.string());
}

std::string SessionStore::canonical_root(const std::string& project_root) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(fs::absolute(project_root), ec);
    if (ec) p = fs::absolute(project_root).lexically_normal();
    std::string s = p.generic_string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

std::string SessionStore::key_for(const std::string& name, const std::string& canonical) const {
    return fnv1a64_hex(canonical + "\n" + name);
}

fs::path SessionStore::record_path(const std::string& key) const { return base_dir_ / (key + ".json"); }

fs::path SessionStore::lock_path(const std::string& key) const { return base_dir_ / (key + ".lock"); }

std::string SessionStore::serialize(const Session& session) {
    json record = session.to_json();
    record["format_version"] = kFormatVersion;
    return record.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

Session SessionStore::parse_record(const fs::path& path) const {
    std::string raw = AtomicFile::read(path);
    try {
        json record = json::parse(raw);
        if (!record.is_object() || !record.contains("format_version") ||
            !record["format_version"].is_number_integer()) {
            throw ReviewerError(ErrorCode::IncompatibleRecord, path.filename().string() + " has no format_version");
        }
        int version = record["format_version"].get<int>();
        if (version != kFormatVersion) {
            throw ReviewerError(ErrorCode::IncompatibleRecord,
                                path.filename().string() + " has format_version " + std::to_string(version) +
                                ", supported is " + std::to_string(kFormatVersion));
        }
        return Session::from_json(record);
    } catch (const json::exception& e) {
        throw ReviewerError(ErrorCode::IncompatibleRecord, path.filename().string() + " is malformed: " + e.what());
    }
}

Session SessionStore::create(const std::string& name, const std::string& project_root) {
    if (name.empty()) {
        throw ReviewerError(ErrorCode::InvalidArguments, "Session name must not be empty");
    }
    const std::string root = canonical_root(project_root);
    const std::string key = key_for(name, root);
    if (fs::exists(record_path(key))) {
        throw ReviewerError(ErrorCode::InvalidArguments, "Session '" + name + "' already exists for " + root);
    }

    Session s;
    s.id = key;
    s.name = name;
    s.project_root = root;
    s.created_at = now_ms();
    s.last_updated = s.created_at;
    save(s);
    spdlog::info("🆕 Session '{}' created for {}", name, root);
    return s;
}

Session SessionStore::load(const std::string& name, const std::string& project_root) const {
    const std::string root = canonical_root(project_root);
    const fs::path path = record_path(key_for(name, root));
    if (!fs::exists(path)) {
        throw ReviewerError(ErrorCode::NotFound, "No session '" + name + "' for " + root);
    }
    Session s = parse_record(path);
    if (s.name != name || s.project_root != root) {
        throw ReviewerError(ErrorCode::NotFound, "No session '" + name + "' for " + root);
    }
    return s;
}

std::optional<Session> SessionStore::find(const std::string& name, const std::string& project_root) const {
    try {
        return load(name, project_root);
    } catch (const ReviewerError& e) {
        if (e.code() == ErrorCode::NotFound) return std::nullopt;
        throw;
    }
}

void SessionStore::save(const Session& session) {
    const std::string root = canonical_root(session.project_root);
    AtomicFile::write(record_path(key_for(session.name, root)), serialize(session));
}

std::vector<SessionSummary> SessionStore::list(const std::optional<std::string>& project_filter,
                                               size_t limit, SortKey sort_by) const {
    std::optional<std::string> root;
    if (project_filter && !project_filter->empty()) root = canonical_root(*project_filter);

    std::vector<SessionSummary> out;
    std::error_code ec;
    for (fs::directory_iterator it(base_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& p = it->path();
        if (p.extension() != ".json" || !it->is_regular_file()) continue;
        try {
            Session s = parse_record(p);
            if (root && s.project_root != *root) continue;
            out.push_back(SessionSummary::of(s));
        } catch (const ReviewerError& e) {
            spdlog::warn("⚠️  Skipping session record {}: {}", p.filename().string(), e.what());
        }
    }
    if (ec) {
        throw ReviewerError(ErrorCode::IoError, "Cannot list " + base_dir_.string() + ": " + ec.message());
    }

    std::sort(out.begin(), out.end(), [sort_by](const SessionSummary& a, const SessionSummary& b) {
        switch (sort_by) {
            case SortKey::CreatedAt:
                if (a.created_at != b.created_at) return a.created_at > b.created_at;
                break;
            case SortKey::Name:
                if (a.name != b.name) return a.name < b.name;
                break;
            case SortKey::Iteration:
                if (a.iteration_count != b.iteration_count) return a.iteration_count > b.iteration_count;
                break;
            case SortKey::LastUpdated:
                if (a.last_updated != b.last_updated) return a.last_updated > b.last_updated;
                break;
        }
        if (a.project_root != b.project_root) return a.project_root < b.project_root;
        return a.name < b.name;
    });
    if (out.size() > limit) out.resize(limit);
    return out;
}

bool SessionStore::remove(const std::string& name, const std::string& project_root) {
    SessionLease lease = acquire(name, project_root, std::chrono::milliseconds(0));
    const fs::path path = record_path(lease.key());
    if (!fs::exists(path)) return false;

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw ReviewerError(ErrorCode::IoError, "Cannot delete " + path.string() + ": " + ec.message());
    }
    spdlog::info("🗑️  Session '{}' deleted", name);
    return true;
}

// --- 3. LEASES ---

SessionLease SessionStore::acquire(const std::string& name, const std::string& project_root,
                                   std::chrono::milliseconds wait) {
    const std::string root = canonical_root(project_root);
    const std::string key = key_for(name, root);
    const auto deadline = std::chrono::steady_clock::now() + wait;

    auto busy = [&]() {
        spdlog::warn("🔒 Session '{}' is busy", name);
        return ReviewerError(ErrorCode::SessionBusy, "Session '" + name + "' is in use by another review");
    };

    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!released_.wait_until(lock, deadline, [&] { return held_.count(key) == 0; })) {
            throw busy();
        }
        held_.insert(key);
    }

    const fs::path lp = lock_path(key);
    int fd = ::open(lp.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        std::string why = std::strerror(errno);
        release(key, -1);
        throw ReviewerError(ErrorCode::IoError, "Cannot open lock file " + lp.string() + ": " + why);
    }

    while (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EINTR) continue;
        if (errno != EWOULDBLOCK) {
            std::string why = std::strerror(errno);
            ::close(fd);
            release(key, -1);
            throw ReviewerError(ErrorCode::IoError, "Cannot lock " + lp.string() + ": " + why);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::close(fd);
            release(key, -1);
            throw busy();
        }
        std::this_thread::sleep_for(kLockPoll);
    }

    return SessionLease(this, key, fd);
}

void SessionStore::release(const std::string& key, int fd) {
    if (fd >= 0) {
        ::flock(fd, LOCK_UN);
        ::close(fd);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_.erase(key);
    }
    released_.notify_all();
}

} // namespace reviewer
