#include <cstdio>
#include <cstring>
#include <errno.h>
#include <signal.h>
#include <time.h>
#include <unistd.h>

#include "common.h"
#include "sys.h"

namespace sys {

void sleep(Duration duration)
{
  if (duration <= 0) return;

  struct timespec spec, left;
  spec.tv_sec  = duration / SECOND;
  spec.tv_nsec = duration % SECOND;
  while (nanosleep(&spec, &left) == -1 && errno == EINTR) {
    spec = left;
  }
}

bool ignoreSignal(int signo, char *errbuf)
{
  struct sigaction sa;
  memset(&sa, 0x00, sizeof(sa));
  sa.sa_handler = SIG_IGN;
  sigemptyset(&sa.sa_mask);

  if (sigaction(signo, &sa, NULL) == -1) {
    if (errbuf) snprintf(errbuf, MAX_ERR_LEN, "sigaction %d error %d:%s", signo, errno, strerror(errno));
    return false;
  }
  return true;
}

bool writeAll(int fd, const char *ptr, size_t len)
{
  size_t left = len;
  while (left > 0) {
    ssize_t nw = write(fd, ptr + len - left, left);
    if (nw == -1) {
      if (errno == EINTR) continue;
      return false;
    }
    left -= nw;
  }
  return true;
}

} // sys
