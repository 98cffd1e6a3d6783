#ifndef __PTYKEEP_HEADERS__
#define __PTYKEEP_HEADERS__

#if __APPLE__
#include <sys/ucred.h>
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#include <sys/socket.h>
#elif __NetBSD__  // do not need pty.h on NetBSD
#include <util.h>
#else
#include <pty.h>
#endif

#include <arpa/inet.h>
#include <ctype.h>
#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message_lite.h>
#include <grp.h>
#include <paths.h>
#include <poll.h>
#include <pthread.h>
#include <pwd.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include "PtyKeep.pb.h"
#include "base64.h"
#include "easylogging++.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Version of the pane-backend protocol spoken by this daemon
static const char *const PANE_BACKEND_PROTOCOL_VERSION = "1";

// Largest single line accepted on either wire protocol
static const size_t MAX_LINE_LENGTH = 16 * 1024 * 1024;
// A client that accepts no bytes for this long is dropped
static const int WRITE_STALL_TIMEOUT_SECS = 10;
// Log files (including stderr captures) kept per prefix across restarts
static const size_t MAX_LOG_FILES_PER_PREFIX = 10;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef PTYKEEP_VERSION
#define PTYKEEP_VERSION "unknown"
#endif

namespace ptykeep {
inline std::ostream &operator<<(std::ostream &os,
                                const ptykeep::SocketEndpoint &se) {
  if (se.has_name()) {
    os << se.name();
  }
  if (se.has_port()) {
    os << ":" << se.port();
  }
  return os;
}

template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

/**
 * @brief Waits up to `usec` microseconds for `fd` to become readable.
 * @return true when data (or EOF) is ready, false on timeout or EINTR.
 */
inline bool waitOnSocketData(int fd, int64_t usec) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = usec / 1000000;
  tv.tv_usec = usec % 1000000;
  int rc = select(fd + 1, &fdset, NULL, NULL, &tv);
  if (rc == -1) {
    if (GetErrno() == EINTR) {
      return false;
    }
    FATAL_FAIL(rc);
  }
  return FD_ISSET(fd, &fdset);
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline string base64Encode(const string &raw) {
  string encoded;
  if (!Base64::Encode(raw, &encoded)) {
    throw std::runtime_error("base64 encode failed");
  }
  return encoded;
}

/**
 * @brief Decodes standard (RFC 4648) base64.
 *
 * Base64::Decode does not reject characters outside the alphabet, so the
 * input is checked here first.
 * @return false when `encoded` is not valid base64.
 */
inline bool base64Decode(const string &encoded, string *out) {
  size_t padding = 0;
  for (size_t i = 0; i < encoded.size(); i++) {
    char c = encoded[i];
    if (c == '=') {
      padding++;
      continue;
    }
    if (padding > 0) {
      // Data after padding
      return false;
    }
    if (!isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '/') {
      return false;
    }
  }
  if (padding > 2 || (padding > 0 && encoded.size() % 4 != 0) ||
      encoded.size() % 4 == 1) {
    return false;
  }
  return Base64::Decode(encoded, out);
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace ptykeep

#endif  // __PTYKEEP_HEADERS__
