/**
 * @file platform.hpp
 * @brief Socket API differences between Winsock2 and POSIX.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>

    #pragma comment(lib, "Ws2_32.lib")
#else
    #include <arpa/inet.h>
    #include <errno.h>
    #include <netinet/in.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <unistd.h>
#endif

namespace airvol {
namespace net {

#ifdef _WIN32
using SocketHandle = SOCKET;
using SocketLength = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;

inline int getLastSocketError() { return WSAGetLastError(); }
inline void closeSocket(SocketHandle s) { ::closesocket(s); }
inline void shutdownSocket(SocketHandle s) { ::shutdown(s, SD_BOTH); }
inline int selectWidth(SocketHandle) { return 0; }

inline bool isTransientSocketError(int err) {
    return err == WSAEWOULDBLOCK || err == WSAEINTR || err == WSAETIMEDOUT
        || err == WSAECONNRESET;  // ICMP port unreachable from an earlier send
}

/**
 * @brief Start Winsock once per process. Safe to call from any thread.
 */
inline bool ensureSocketsInitialized() {
    static const bool started = [] {
        WSADATA wsaData;
        return WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
    }();
    return started;
}
#else
using SocketHandle = int;
using SocketLength = socklen_t;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

inline int getLastSocketError() { return errno; }
inline void closeSocket(SocketHandle s) { ::close(s); }
inline void shutdownSocket(SocketHandle s) { ::shutdown(s, SHUT_RDWR); }
inline int selectWidth(SocketHandle s) { return s + 1; }

inline bool isTransientSocketError(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR
        || err == ECONNREFUSED;
}

inline bool ensureSocketsInitialized() { return true; }
#endif

/**
 * @brief Set a boolean SOL_SOCKET option.
 */
inline bool setSocketFlag(SocketHandle s, int option, bool enable) {
    int value = enable ? 1 : 0;
    return ::setsockopt(s, SOL_SOCKET, option,
                        reinterpret_cast<const char*>(&value), sizeof(value)) == 0;
}

}  // namespace net
}  // namespace airvol
