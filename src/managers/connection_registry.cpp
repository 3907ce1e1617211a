#include "connection_registry.hpp"
#include <core/connection_id.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <chrono>

ConnectionRegistry::Entry::~Entry() {
    if (session) session->close();
}

ConnectionRegistry::ConnectionRegistry(RegistrySettings settings)
    : settings_(settings) {}

ConnectionRegistry::~ConnectionRegistry() {
    clear();
}

std::string ConnectionRegistry::insert(const std::string& id,
                                       std::unique_ptr<ShellSession> session) {
    auto entry = std::make_shared<Entry>();
    entry->session = std::move(session);

    std::shared_ptr<Entry> displaced;
    std::string stored_id = id;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        if (settings_.duplicate_ids == DuplicateIdPolicy::Unique) {
            stored_id = make_unique_connection_id(id, [this](const std::string& candidate) {
                return entries_.count(candidate) > 0;
            });
        } else {
            auto it = entries_.find(id);
            if (it != entries_.end()) displaced = it->second;
        }
        entries_[stored_id] = entry;
    }

    if (displaced) {
        // Closed by ~Entry once any command still running on it returns.
        sshdesk_log(fmt::format("registry: replacing connection {}, dropping previous session", id));
        displaced.reset();
    }

    sshdesk_log(fmt::format("registry: registered {}", stored_id));
    return stored_id;
}

Result<void> ConnectionRegistry::run_locked(const std::string& id,
                                            const std::function<void(ShellSession&)>& fn) {
    auto entry = find(id);
    if (!entry) {
        return Result<void>::Err(ErrorKind::NotFound, MSG_NOT_FOUND);
    }

    std::unique_lock<std::timed_mutex> global_lock(dispatch_mutex_, std::defer_lock);
    if (settings_.locking == LockingMode::Global && !lock_timed(global_lock)) {
        return Result<void>::Err(ErrorKind::LockUnavailable,
                                 "Lock error: another command is still running");
    }

    std::unique_lock<std::timed_mutex> entry_lock(entry->mutex, std::defer_lock);
    if (!lock_timed(entry_lock)) {
        return Result<void>::Err(ErrorKind::LockUnavailable,
                                 fmt::format("Lock error: connection {} is busy", id));
    }

    fn(*entry->session);
    return Result<void>::Ok();
}

Result<std::string> ConnectionRegistry::get_directory(const std::string& id) const {
    auto entry = find(id);
    if (!entry) {
        return Result<std::string>::Err(ErrorKind::NotFound, MSG_NOT_FOUND);
    }
    return Result<std::string>::Ok(entry->session->current_directory());
}

bool ConnectionRegistry::remove(const std::string& id) {
    std::shared_ptr<Entry> removed;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return false;
        removed = std::move(it->second);
        entries_.erase(it);
    }
    sshdesk_log(fmt::format("registry: removed {}", id));
    // The session closes when the last holder (this, or an in-flight
    // command) lets go of the entry.
    return true;
}

bool ConnectionRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return entries_.count(id) > 0;
}

std::vector<std::string> ConnectionRegistry::list_ids() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& kv : entries_) {
        ids.push_back(kv.first);
    }
    return ids;
}

size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return entries_.size();
}

void ConnectionRegistry::clear() {
    std::map<std::string, std::shared_ptr<Entry>> dropped;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        dropped.swap(entries_);
    }
    // Entries (and their sessions) are destroyed here, outside the map lock.
}

std::shared_ptr<ConnectionRegistry::Entry> ConnectionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return nullptr;
    return it->second;
}

bool ConnectionRegistry::lock_timed(std::unique_lock<std::timed_mutex>& lock) {
    if (settings_.lock_wait_ms <= 0) {
        lock.lock();
        return true;
    }
    return lock.try_lock_for(std::chrono::milliseconds(settings_.lock_wait_ms));
}
