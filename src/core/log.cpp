#include "log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "sshdesk_debug.log").string();
    return path;
}

} // namespace

std::string sshdesk_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_storage();
}

void set_sshdesk_log_path(const std::string& path) {
    if (path.empty()) return;
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path;
}

void sshdesk_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    std::string line = fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (!out) return;
    out << line;
}

void sshdesk_log_ssh(const std::string& label, const std::string& cmd,
                     const SSHResult& r) {
    sshdesk_log(fmt::format("{} CMD: {}", label, cmd));
    sshdesk_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                            r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        sshdesk_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
