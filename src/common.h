#ifndef _COMMON_H_
#define _COMMON_H_

#include <string>

#define MAX_ERR_LEN    512

/* run cmd through /bin/sh, output collects its stdout untouched,
 * status its exit status */
bool shell(const char *cmd, std::string *output, int *status, char *errbuf);

#endif
