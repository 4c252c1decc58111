#include <cstdio>
#include <cstring>
#include <string>

#include "common.h"
#include "utf8.h"
#include "util.h"

namespace util {

static const uint64_t DURATION_LIMIT = (uint64_t) 1 << 63;

struct DurationUnit {
  const char *name;
  uint64_t    nanos;
};

static const DurationUnit DURATION_UNITS[] = {
  {"ns", NANOSECOND},
  {"us", MICROSECOND},
  {"\xC2\xB5s", MICROSECOND},  // U+00B5 micro sign
  {"\xCE\xBCs", MICROSECOND},  // U+03BC greek mu
  {"ms", MILLISECOND},
  {"s",  SECOND},
  {"m",  MINUTE},
  {"h",  HOUR},
  {0, 0}
};

inline bool isDigit(char c)
{
  return c >= '0' && c <= '9';
}

/* consume [0-9]*, false on overflow */
static bool leadingInt(const char **ptr, uint64_t *val)
{
  *val = 0;
  for (; isDigit(**ptr); ++*ptr) {
    if (*val > (DURATION_LIMIT-1) / 10) return false;
    *val = *val * 10 + (**ptr - '0');
    if (*val > DURATION_LIMIT) return false;
  }
  return true;
}

/* consume [0-9]* after '.', digits past int64 precision are dropped */
static void leadingFraction(const char **ptr, uint64_t *val, double *scale)
{
  *val = 0;
  *scale = 1;
  bool overflow = false;
  for (; isDigit(**ptr); ++*ptr) {
    if (overflow) continue;
    if (*val > (DURATION_LIMIT-1) / 10) {
      overflow = true;
      continue;
    }
    uint64_t v = *val * 10 + (**ptr - '0');
    if (v > DURATION_LIMIT) {
      overflow = true;
      continue;
    }
    *val = v;
    *scale *= 10;
  }
}

bool parseDuration(const char *str, Duration *duration, char *errbuf)
{
  const char *ptr = str;
  bool neg = false;
  if (*ptr == '-' || *ptr == '+') {
    neg = *ptr == '-';
    ++ptr;
  }

  if (strcmp(ptr, "0") == 0) {
    *duration = 0;
    return true;
  }
  if (*ptr == '\0') {
    snprintf(errbuf, MAX_ERR_LEN, "invalid duration \"%s\"", str);
    return false;
  }

  uint64_t d = 0;
  while (*ptr) {
    if (*ptr != '.' && !isDigit(*ptr)) {
      snprintf(errbuf, MAX_ERR_LEN, "invalid duration \"%s\"", str);
      return false;
    }

    const char *start = ptr;
    uint64_t v;
    if (!leadingInt(&ptr, &v)) {
      snprintf(errbuf, MAX_ERR_LEN, "invalid duration \"%s\"", str);
      return false;
    }
    bool pre = ptr != start;

    uint64_t f = 0;
    double scale = 1;
    bool post = false;
    if (*ptr == '.') {
      ++ptr;
      start = ptr;
      leadingFraction(&ptr, &f, &scale);
      post = ptr != start;
    }
    if (!pre && !post) {
      snprintf(errbuf, MAX_ERR_LEN, "invalid duration \"%s\"", str);
      return false;
    }

    start = ptr;
    while (*ptr && *ptr != '.' && !isDigit(*ptr)) ++ptr;
    if (ptr == start) {
      snprintf(errbuf, MAX_ERR_LEN, "missing unit in duration \"%s\"", str);
      return false;
    }

    std::string name(start, ptr - start);
    const DurationUnit *unit = DURATION_UNITS;
    for (; unit->name; ++unit) {
      if (name == unit->name) break;
    }
    if (!unit->name) {
      snprintf(errbuf, MAX_ERR_LEN, "unknown unit \"%s\" in duration \"%s\"", name.c_str(), str);
      return false;
    }

    if (v > DURATION_LIMIT / unit->nanos) {
      snprintf(errbuf, MAX_ERR_LEN, "invalid duration \"%s\"", str);
      return false;
    }
    v *= unit->nanos;
    if (f > 0) {
      v += (uint64_t) ((double) f * ((double) unit->nanos / scale));
      if (v > DURATION_LIMIT) {
        snprintf(errbuf, MAX_ERR_LEN, "invalid duration \"%s\"", str);
        return false;
      }
    }
    d += v;
    if (d > DURATION_LIMIT) {
      snprintf(errbuf, MAX_ERR_LEN, "invalid duration \"%s\"", str);
      return false;
    }
  }

  if (neg) {
    *duration = d == DURATION_LIMIT ? INT64_MIN : -(Duration) d;
    return true;
  }
  if (d > DURATION_LIMIT - 1) {
    snprintf(errbuf, MAX_ERR_LEN, "invalid duration \"%s\"", str);
    return false;
  }
  *duration = (Duration) d;
  return true;
}

/* writes v/10^prec's fraction digits backwards from w, trailing zeros omitted */
static size_t fmtFrac(char *buf, size_t w, uint64_t *v, int prec)
{
  bool print = false;
  for (int i = 0; i < prec; ++i) {
    int digit = *v % 10;
    print = print || digit != 0;
    if (print) buf[--w] = digit + '0';
    *v /= 10;
  }
  if (print) buf[--w] = '.';
  return w;
}

static size_t fmtInt(char *buf, size_t w, uint64_t v)
{
  if (v == 0) {
    buf[--w] = '0';
  } else {
    while (v > 0) {
      buf[--w] = v % 10 + '0';
      v /= 10;
    }
  }
  return w;
}

std::string formatDuration(Duration duration)
{
  char buf[32];
  size_t w = sizeof(buf);

  uint64_t u = (uint64_t) duration;
  bool neg = duration < 0;
  if (neg) u = -u;

  if (u < (uint64_t) SECOND) {
    int prec = 0;
    buf[--w] = 's';
    --w;
    if (u == 0) {
      return "0s";
    } else if (u < (uint64_t) MICROSECOND) {
      prec = 0;
      buf[w] = 'n';
    } else if (u < (uint64_t) MILLISECOND) {
      prec = 3;
      --w;
      memcpy(buf + w, "\xC2\xB5", 2);
    } else {
      prec = 6;
      buf[w] = 'm';
    }
    w = fmtFrac(buf, w, &u, prec);
    w = fmtInt(buf, w, u);
  } else {
    buf[--w] = 's';
    w = fmtFrac(buf, w, &u, 9);
    w = fmtInt(buf, w, u % 60);
    u /= 60;

    if (u > 0) {
      buf[--w] = 'm';
      w = fmtInt(buf, w, u % 60);
      u /= 60;
      if (u > 0) {
        buf[--w] = 'h';
        w = fmtInt(buf, w, u);
      }
    }
  }

  if (neg) buf[--w] = '-';
  return std::string(buf + w, sizeof(buf) - w);
}

static int digitValue(char c)
{
  if (isDigit(c)) return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parseUint(const char *ptr, unsigned *val)
{
  if (!*ptr) return false;

  /* 0x 0o 0b prefixes or a leading 0 pick the base, underscores may
   * separate digits. saw is '0' after a digit or prefix, '_' after an underscore */
  unsigned base = 10;
  char saw = '^';
  if (ptr[0] == '0' && ptr[1]) {
    char c = ptr[1] | 0x20;
    if ((c == 'x' || c == 'o' || c == 'b') && ptr[2]) {
      base = c == 'x' ? 16 : (c == 'o' ? 8 : 2);
      ptr += 2;
    } else {
      base = 8;
      ptr += 1;
    }
    saw = '0';
  }

  uint64_t v = 0;
  for (; *ptr; ++ptr) {
    if (*ptr == '_') {
      if (saw != '0') return false;
      saw = '_';
      continue;
    }

    int d = digitValue(*ptr);
    if (d < 0 || d >= (int) base) return false;
    saw = '0';

    v = v * base + d;
    if (v > 0xFFFFFFFFULL) return false;
  }
  if (saw == '_') return false;

  *val = v;
  return true;
}

bool parseBool(const char *ptr, bool *val)
{
  static const char *trues[]  = {"1", "t", "T", "true", "TRUE", "True", 0};
  static const char *falses[] = {"0", "f", "F", "false", "FALSE", "False", 0};

  for (int i = 0; trues[i]; ++i) {
    if (strcmp(ptr, trues[i]) == 0) {
      *val = true;
      return true;
    }
  }
  for (int i = 0; falses[i]; ++i) {
    if (strcmp(ptr, falses[i]) == 0) {
      *val = false;
      return true;
    }
  }
  return false;
}

struct RuneRange {
  uint32_t lo, hi;
};

/* code points a terminal would not show as themselves: spaces other than
 * U+0020, format characters, private use, and the larger unassigned blocks */
static const RuneRange NOT_PRINT[] = {
  {0x0000, 0x001F}, {0x007F, 0x00A0}, {0x00AD, 0x00AD},
  {0x0378, 0x0379}, {0x0380, 0x0383}, {0x038B, 0x038B}, {0x038D, 0x038D}, {0x03A2, 0x03A2},
  {0x0600, 0x0605}, {0x061C, 0x061C}, {0x06DD, 0x06DD}, {0x070F, 0x070F},
  {0x1680, 0x1680}, {0x180E, 0x180E},
  {0x2000, 0x200F}, {0x2028, 0x202F}, {0x205F, 0x206F},
  {0x2FD6, 0x2FEF}, {0x3000, 0x3000},
  {0xD7FC, 0xF8FF},                    // unassigned, surrogates, private use
  {0xFDD0, 0xFDEF}, {0xFEFF, 0xFEFF}, {0xFFF9, 0xFFFB},
  {0x2FA20, 0x2FFFF},
  {0x40000, 0xDFFFF},
  {0xE0000, 0xE00FF}, {0xE01F0, 0x10FFFF},
};

static bool isPrint(uint32_t rune)
{
  if (rune > utf8::MAX_RUNE) return false;
  if ((rune & 0xFFFE) == 0xFFFE) return false;           // noncharacters

  size_t lo = 0, hi = sizeof(NOT_PRINT) / sizeof(NOT_PRINT[0]);
  while (lo < hi) {
    size_t mid = (lo + hi) / 2;
    if (rune < NOT_PRINT[mid].lo) hi = mid;
    else if (rune > NOT_PRINT[mid].hi) lo = mid + 1;
    else return false;
  }
  return true;
}

std::string quoteRune(uint32_t rune)
{
  std::string s(1, '"');
  char buffer[16];

  if (rune > utf8::MAX_RUNE || (rune >= 0xD800 && rune <= 0xDFFF)) rune = utf8::RUNE_ERROR;

  if (rune == '"' || rune == '\\') {
    s.append(1, '\\');
    s.append(1, (char) rune);
  } else if (isPrint(rune)) {
    int n = utf8::encodeRune(rune, buffer);
    s.append(buffer, n);
  } else {
    switch (rune) {
    case '\a': s.append("\\a"); break;
    case '\b': s.append("\\b"); break;
    case '\f': s.append("\\f"); break;
    case '\n': s.append("\\n"); break;
    case '\r': s.append("\\r"); break;
    case '\t': s.append("\\t"); break;
    case '\v': s.append("\\v"); break;
    default:
      if (rune < ' ' || rune == 0x7F) {
        snprintf(buffer, sizeof(buffer), "\\x%02x", rune);
      } else if (rune < 0x10000) {
        snprintf(buffer, sizeof(buffer), "\\u%04x", rune);
      } else {
        snprintf(buffer, sizeof(buffer), "\\U%08x", rune);
      }
      s.append(buffer);
    }
  }

  s.append(1, '"');
  return s;
}

std::string formatCodePoint(uint32_t rune)
{
  char buffer[16];
  int n = snprintf(buffer, sizeof(buffer), "U+%04X", rune);
  return std::string(buffer, n);
}

} // namespace util
