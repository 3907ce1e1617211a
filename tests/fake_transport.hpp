#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <core/types.hpp>
#include <ssh/connection_factory.hpp>
#include <ssh/transport.hpp>

// A remote host as seen through exec channels: every command starts in the
// login directory, `cd X && rest` moves for the rest of that one line only.
struct FakeRemote {
    std::mutex mutex;
    std::condition_variable cv;

    std::string home = "/home/alice";
    std::set<std::string> directories = {"/", "/home", "/home/alice", "/home/alice/src",
                                         "/tmp", "/var", "/var/log"};

    std::vector<std::string> commands;     // command lines exactly as received
    std::vector<ExecOptions> options;
    int transports_closed = 0;

    std::optional<std::pair<ErrorKind, std::string>> fail_next;
    bool pwd_fails = false;

    // `block` parks the calling thread until release() is called.
    bool blocked = false;
    bool released = false;

    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
        cv.notify_all();
    }

    bool wait_until_blocked() {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5), [this] { return blocked; });
    }

    std::string last_command() {
        std::lock_guard<std::mutex> lock(mutex);
        return commands.empty() ? "" : commands.back();
    }

    int closed_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return transports_closed;
    }

    size_t command_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return commands.size();
    }
};

namespace fake_shell {

inline std::string unquote(const std::string& arg) {
    if (arg.size() < 2 || arg.front() != '\'' || arg.back() != '\'') return arg;
    std::string inner = arg.substr(1, arg.size() - 2);
    std::string out;
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner.compare(i, 4, "'\\''") == 0) {
            out += '\'';
            i += 3;
        } else {
            out += inner[i];
        }
    }
    return out;
}

inline std::string resolve(const std::string& cwd, const std::string& home, std::string arg) {
    while (!arg.empty() && arg.back() == ' ') arg.pop_back();
    while (!arg.empty() && arg.front() == ' ') arg.erase(0, 1);
    arg = unquote(arg);
    if (arg.empty() || arg == "~") return home;
    std::string path = arg[0] == '/' ? arg : (cwd == "/" ? "" : cwd) + "/" + arg;

    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        std::string part = path.substr(start, slash - start);
        if (part == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (!part.empty() && part != ".") {
            parts.push_back(part);
        }
        start = slash + 1;
    }
    std::string out;
    for (const auto& p : parts) out += "/" + p;
    return out.empty() ? "/" : out;
}

} // namespace fake_shell

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeRemote> remote) : remote_(std::move(remote)) {}

    ~FakeTransport() override { close(); }

    Result<SSHResult> exec(const std::string& command, const ExecOptions& options) override {
        using R = Result<SSHResult>;
        std::unique_lock<std::mutex> lock(remote_->mutex);
        if (closed_) return R::Err(ErrorKind::Channel, "Session is closed");

        remote_->commands.push_back(command);
        remote_->options.push_back(options);

        if (remote_->fail_next) {
            auto failure = *remote_->fail_next;
            remote_->fail_next.reset();
            return R::Err(failure.first, failure.second);
        }

        std::string cwd = remote_->home;
        std::string rest = command;
        if (rest.rfind("cd ", 0) == 0) {
            size_t amp = rest.find(" && ");
            std::string arg = rest.substr(3, amp == std::string::npos ? std::string::npos : amp - 3);
            std::string target = fake_shell::resolve(cwd, remote_->home, arg);
            if (!remote_->directories.count(target)) {
                return R::Ok(SSHResult{1, "", "sh: cd: " + fake_shell::unquote(arg)
                                                  + ": No such file or directory\n"});
            }
            cwd = target;
            rest = amp == std::string::npos ? "" : rest.substr(amp + 4);
        }

        if (rest == "pwd") {
            if (remote_->pwd_fails) return R::Ok(SSHResult{1, "", "pwd: permission denied\n"});
            return R::Ok(SSHResult{0, cwd + "\n", ""});
        }
        if (rest.rfind("echo ", 0) == 0) {
            return R::Ok(SSHResult{0, rest.substr(5) + "\n", ""});
        }
        if (rest == "false") {
            return R::Ok(SSHResult{1, "", ""});
        }
        if (rest == "block") {
            remote_->blocked = true;
            remote_->cv.notify_all();
            remote_->cv.wait(lock, [this] { return remote_->released; });
            return R::Ok(SSHResult{0, "unblocked\n", ""});
        }
        return R::Ok(SSHResult{127, "", "sh: " + rest + ": command not found\n"});
    }

    void close() override {
        std::lock_guard<std::mutex> lock(remote_->mutex);
        if (closed_) return;
        closed_ = true;
        remote_->transports_closed++;
    }

    bool is_active() const override {
        std::lock_guard<std::mutex> lock(remote_->mutex);
        return !closed_;
    }

private:
    std::shared_ptr<FakeRemote> remote_;
    bool closed_ = false;
};

// Stands in for open_ssh_transport: one FakeRemote per host.
class FakeServer {
public:
    std::string accepted_password = "secret";
    std::optional<std::pair<ErrorKind, std::string>> connect_error;
    std::vector<ConnectionConfig> attempts;

    std::shared_ptr<FakeRemote> remote(const std::string& host) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& r = remotes_[host];
        if (!r) r = std::make_shared<FakeRemote>();
        return r;
    }

    TransportFactory factory() {
        return [this](const ConnectionConfig& config, const SessionSettings&)
                   -> Result<std::unique_ptr<Transport>> {
            using R = Result<std::unique_ptr<Transport>>;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                attempts.push_back(config);
            }
            if (connect_error) return R::Err(connect_error->first, connect_error->second);
            if (config.password && *config.password != accepted_password) {
                return R::Err(ErrorKind::Auth,
                              "Password authentication failed: Authentication failed (username/password)");
            }
            return R::Ok(std::make_unique<FakeTransport>(remote(config.host)));
        };
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<FakeRemote>> remotes_;
};
