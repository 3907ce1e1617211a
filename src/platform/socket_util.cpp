#include "socket_util.hpp"
#include <cstring>
#include <cerrno>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <arpa/inet.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

void enable_tcp_keepalive(socket_t sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, reinterpret_cast<const char*>(&on), sizeof(on));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, reinterpret_cast<const char*>(&keepidle), sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, reinterpret_cast<const char*>(&keepintvl), sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, reinterpret_cast<const char*>(&keepcnt), sizeof(keepcnt));
#endif
}

bool resolve_ipv4(const std::string& host, std::string& address, std::string& error) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (gai != 0 || !res) {
        error = "Failed to resolve IPv4 address for " + host + ": " +
                (gai != 0 ? std::string(gai_strerror(gai)) : std::string("no results"));
        return false;
    }

    char buf[INET_ADDRSTRLEN];
    auto* sin = reinterpret_cast<struct sockaddr_in*>(res->ai_addr);
    const char* ok = inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    freeaddrinfo(res);
    if (!ok) {
        error = "Failed to resolve IPv4 address for " + host;
        return false;
    }
    address = buf;
    return true;
}

socket_t connect_tcp(const std::string& ipv4, uint16_t port, int timeout_ms,
                     std::string& error) {
    init_networking();

    socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock == SSHDESK_INVALID_SOCKET) {
        error = "Failed to create socket";
        return SSHDESK_INVALID_SOCKET;
    }

    set_nonblocking(sock);

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ipv4.c_str(), &addr.sin_addr) != 1) {
        close_socket(sock);
        error = "Invalid IPv4 address: " + ipv4;
        return SSHDESK_INVALID_SOCKET;
    }

    int ret = connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        error = "Failed to establish TCP connection: " + std::string(strerror(errno));
        close_socket(sock);
        return SSHDESK_INVALID_SOCKET;
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            close_socket(sock);
            error = "Failed to establish TCP connection: timed out";
            return SSHDESK_INVALID_SOCKET;
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            error = "Failed to establish TCP connection: " + std::string(strerror(sock_err));
            return SSHDESK_INVALID_SOCKET;
        }
    }

    return sock;
}

} // namespace platform
