#ifndef _UTIL_H_
#define _UTIL_H_

#include <cstring>
#include <string>
#include <stdint.h>

typedef int64_t Duration;

static const Duration NANOSECOND  = 1;
static const Duration MICROSECOND = 1000 * NANOSECOND;
static const Duration MILLISECOND = 1000 * MICROSECOND;
static const Duration SECOND      = 1000 * MILLISECOND;
static const Duration MINUTE      = 60 * SECOND;
static const Duration HOUR        = 60 * MINUTE;

namespace util {

/* "300ms", "-1.5h", "2h45m", units ns us µs ms s m h */
bool parseDuration(const char *str, Duration *duration, char *errbuf);
std::string formatDuration(Duration duration);

/* decimal, 0x hex, 0o or leading 0 octal, 0b binary, '_' between digits */
bool parseUint(const char *ptr, unsigned *val);
/* 1 t T true TRUE True, 0 f F false FALSE False */
bool parseBool(const char *ptr, bool *val);

/* double-quoted literal of a single rune, escaped for a terminal */
std::string quoteRune(uint32_t rune);
/* U+0041 */
std::string formatCodePoint(uint32_t rune);

#define HEXMAP "0123456789abcdef"
inline const char *binToHex(const unsigned char *bin, size_t len, char *buffer)
{
  const static char *hexmap = HEXMAP;
  char *ptr = buffer;
  for (size_t i = 0; i < len; ++i) {
    *ptr++ = hexmap[(bin[i] >> 4)];
    *ptr++ = hexmap[bin[i] & 0x0F];
  }
  *ptr = '\0';
  return buffer;
}

} // namespace util

#endif
