#ifndef __TB_HEADERS__
#define __TB_HEADERS__

#if __APPLE__
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#elif __NetBSD__  // do not need pty.h on NetBSD
#include <util.h>
#else
#include <pty.h>
#endif

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <poll.h>
#include <pwd.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "JsonLib.hpp"
#include "easylogging++.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Size of a single non-blocking read from a shell transport
const int TRANSPORT_READ_CHUNK = 4096;

// Terminal geometry used until the browser reports its own
const int DEFAULT_TERMINAL_ROWS = 24;
const int DEFAULT_TERMINAL_COLS = 80;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef TB_VERSION
#define TB_VERSION "unknown"
#endif

namespace tb {
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

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline string GetOsUserName() {
  passwd *pwd = getpwuid(getuid());
  if (pwd == NULL || pwd->pw_name == NULL) {
    return to_string(getuid());
  }
  return string(pwd->pw_name);
}

inline void HandleTerminate() {
  static std::once_flag installed;
  std::call_once(installed, []() {
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
  });
}

inline void InterruptSignalHandler(int signum) {
  LOG(WARNING) << "Interrupted by signal " << signum;
  CLOG(INFO, "stdout") << endl << "Interrupted, exiting." << endl;
  ::exit(signum);
}
}  // namespace tb

#endif
