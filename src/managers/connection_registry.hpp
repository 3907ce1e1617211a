#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>
#include <core/types.hpp>
#include <shell/shell_session.hpp>

// Owns every live ShellSession, keyed by connection id.
//
// Locking:
//   map_mutex_     guards the map itself; held only for insert/remove/lookup.
//   Entry::mutex   serializes commands on one connection and is held for the
//                  whole remote round trip.
//   dispatch_mutex_ only in LockingMode::Global: one command at a time across
//                  all connections.
//
// Entries are shared_ptrs so a connection removed mid-command is closed when
// that command finishes, not underneath it.
class ConnectionRegistry {
public:
    explicit ConnectionRegistry(RegistrySettings settings = {});
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Register a session. Returns the id it was stored under, which differs
    // from `id` only under DuplicateIdPolicy::Unique.
    std::string insert(const std::string& id, std::unique_ptr<ShellSession> session);

    // Run fn(session) with the connection locked.
    // Errors: NotFound, LockUnavailable
    template <typename Fn>
    auto with_session(const std::string& id, Fn&& fn)
        -> Result<std::invoke_result_t<Fn&, ShellSession&>> {
        using T = std::invoke_result_t<Fn&, ShellSession&>;
        T value{};
        auto r = run_locked(id, [&](ShellSession& s) { value = fn(s); });
        if (r.is_err()) return Result<T>::Err(r.kind, r.error);
        return Result<T>::Ok(std::move(value));
    }

    // Errors: NotFound
    Result<std::string> get_directory(const std::string& id) const;

    // True if an entry existed and was removed.
    bool remove(const std::string& id);

    bool contains(const std::string& id) const;
    std::vector<std::string> list_ids() const;
    size_t size() const;

    // Drop every connection (process teardown).
    void clear();

    const RegistrySettings& settings() const { return settings_; }

private:
    struct Entry {
        std::timed_mutex mutex;
        std::unique_ptr<ShellSession> session;

        ~Entry();
    };

    Result<void> run_locked(const std::string& id,
                            const std::function<void(ShellSession&)>& fn);
    std::shared_ptr<Entry> find(const std::string& id) const;
    bool lock_timed(std::unique_lock<std::timed_mutex>& lock);

    RegistrySettings settings_;
    mutable std::mutex map_mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    std::timed_mutex dispatch_mutex_;
};
