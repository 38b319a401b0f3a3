/**
 * @file socket_compat.h
 * @brief Minimal BSD / Winsock socket portability layer
 */

#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")
typedef SOCKET socket_t;
typedef int ssize_t;
#define SOCKET_ERROR_CODE WSAGetLastError()
#define poll WSAPoll
#define VOXSERVE_SHUT_RDWR SD_BOTH
#define VOXSERVE_MSG_NOSIGNAL 0
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
typedef int socket_t;
#define INVALID_SOCKET -1
#define SOCKET_ERROR -1
#define SOCKET_ERROR_CODE errno
#define closesocket ::close
#define VOXSERVE_SHUT_RDWR SHUT_RDWR
#ifdef MSG_NOSIGNAL
#define VOXSERVE_MSG_NOSIGNAL MSG_NOSIGNAL
#else
#define VOXSERVE_MSG_NOSIGNAL 0
#endif
#endif
