#ifndef _SYS_H_
#define _SYS_H_

#include "util.h"

namespace sys {

/* sleep the whole duration even if signals interrupt it,
 * a non-positive duration returns at once */
void sleep(Duration duration);

bool ignoreSignal(int signo, char *errbuf);

/* write all of len, restarting on EINTR and short writes */
bool writeAll(int fd, const char *ptr, size_t len);

} // sys
#endif
