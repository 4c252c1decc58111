#include <cstdio>
#include <cstring>
#include <string>
#include <errno.h>
#include <sys/wait.h>

#include "common.h"

bool shell(const char *cmd, std::string *output, int *status, char *errbuf)
{
  FILE *fp = popen(cmd, "r");
  if (!fp) {
    snprintf(errbuf, MAX_ERR_LEN, "%s exec error %d:%s", cmd, errno, strerror(errno));
    return false;
  }

  char buf[256];
  size_t nn;
  while ((nn = fread(buf, 1, 256, fp)) > 0) {
    output->append(buf, nn);
  }

  int rc = pclose(fp);
  if (rc == -1) {
    snprintf(errbuf, MAX_ERR_LEN, "%s wait error %d:%s", cmd, errno, strerror(errno));
    return false;
  }

  if (WIFEXITED(rc)) *status = WEXITSTATUS(rc);
  else if (WIFSIGNALED(rc)) *status = 128 + WTERMSIG(rc);
  else *status = rc;
  return true;
}
