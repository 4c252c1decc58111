#include <cstdio>
#include <cstring>
#include <string>

#include "logger.h"
#include "unittesthelper.h"
#include "common.h"
#include "utf8.h"
#include "util.h"

LOGGER_INIT();

static char errbuf[MAX_ERR_LEN];

DEFINE(parseDuration)
{
  struct {
    const char *str;
    Duration    want;
  } cases[] = {
    {"0", 0},
    {"-0", 0},
    {"1s", SECOND},
    {"100ms", 100 * MILLISECOND},
    {"1.5s", 1500 * MILLISECOND},
    {".5s", 500 * MILLISECOND},
    {"5.s", 5 * SECOND},
    {"+5s", 5 * SECOND},
    {"-2s", -2 * SECOND},
    {"1h2m0.5s", HOUR + 2 * MINUTE + 500 * MILLISECOND},
    {"300ns", 300},
    {"3us", 3 * MICROSECOND},
    {"3\xC2\xB5s", 3 * MICROSECOND},
    {"3\xCE\xBCs", 3 * MICROSECOND},
    {"0.1ms", 100 * MICROSECOND},
    {"9223372036854775807ns", INT64_MAX},
    {0, 0}
  };

  for (int i = 0; cases[i].str; ++i) {
    Duration d = -1;
    bool rc = util::parseDuration(cases[i].str, &d, errbuf);
    check(rc, "parse %s error %s", cases[i].str, errbuf);
    check(d == cases[i].want, "parse %s = %lld, want %lld", cases[i].str,
          (long long) d, (long long) cases[i].want);
  }
}

DEFINE(parseDurationError)
{
  const char *cases[] = {
    "", "-", "s", "1", "10", ".s", "1.0", "3x", "1s2", "1sm", "1 s",
    "9223372036854775808ns", "3000000h", 0
  };

  for (int i = 0; cases[i]; ++i) {
    Duration d = 12345;
    errbuf[0] = '\0';
    bool rc = util::parseDuration(cases[i], &d, errbuf);
    check(!rc, "parse \"%s\" should fail, got %lld", cases[i], (long long) d);
    check(d == 12345, "failed parse \"%s\" touched the result", cases[i]);
    check(strstr(errbuf, cases[i]), "errbuf \"%s\" misses the input", errbuf);
  }
}

DEFINE(formatDuration)
{
  struct {
    Duration    d;
    const char *want;
  } cases[] = {
    {0, "0s"},
    {1, "1ns"},
    {1100, "1.1\xC2\xB5s"},
    {2200 * MICROSECOND, "2.2ms"},
    {100 * MILLISECOND, "100ms"},
    {SECOND, "1s"},
    {1100 * MILLISECOND, "1.1s"},
    {1800 * MILLISECOND, "1.8s"},
    {MINUTE + 500 * MILLISECOND, "1m0.5s"},
    {2 * HOUR, "2h0m0s"},
    {HOUR + 2 * MINUTE + 3 * SECOND + 4, "1h2m3.000000004s"},
    {-2 * SECOND, "-2s"},
    {-1, "-1ns"},
    {INT64_MIN, "-2562047h47m16.854775808s"},
    {0, 0}
  };

  for (int i = 0; cases[i].want; ++i) {
    std::string s = util::formatDuration(cases[i].d);
    check(s == cases[i].want, "format %lld = %s, want %s", (long long) cases[i].d, PTRS(s), cases[i].want);
  }

  /* what is printed parses back */
  Duration d;
  bool rc = util::parseDuration(util::formatDuration(1234567 * MICROSECOND).c_str(), &d, errbuf);
  check(rc && d == 1234567 * MICROSECOND, "reparse %s", errbuf);
}

DEFINE(parseUint)
{
  unsigned v = 99;
  check(util::parseUint("0", &v) && v == 0, "0 -> %u", v);
  check(util::parseUint("7", &v) && v == 7, "7 -> %u", v);
  check(util::parseUint("4294967295", &v) && v == 4294967295U, "max -> %u", v);

  v = 99;
  check(!util::parseUint("", &v), "empty accepted");
  check(!util::parseUint("-1", &v), "negative accepted");
  check(!util::parseUint("3x", &v), "trailing garbage accepted");
  check(!util::parseUint("4294967296", &v), "overflow accepted");
  check(v == 99, "failed parse touched the result %u", v);

  /* the prefix picks the base, as Go's flag package does */
  struct {
    const char *str;
    unsigned    want;
  } bases[] = {
    {"0x7", 7}, {"0XfF", 255}, {"07", 7}, {"010", 8}, {"0o17", 15}, {"0b101", 5},
    {"1_000", 1000}, {"0x_1f", 31}, {"0_7", 7}, {"00", 0}, {0, 0}
  };
  for (int i = 0; bases[i].str; ++i) {
    check(util::parseUint(bases[i].str, &v) && v == bases[i].want, "%s -> %u", bases[i].str, v);
  }

  const char *bad[] = { "0x", "0b", "08", "0b2", "0xg", "_1", "1_", "1__0", "0x1_", "0xFFFFFFFFF", 0 };
  for (int i = 0; bad[i]; ++i) {
    check(!util::parseUint(bad[i], &v), "%s accepted as %u", bad[i], v);
  }
}

DEFINE(parseBool)
{
  const char *trues[]  = {"1", "t", "T", "true", "TRUE", "True", 0};
  const char *falses[] = {"0", "f", "F", "false", "FALSE", "False", 0};

  bool v;
  for (int i = 0; trues[i]; ++i) {
    v = false;
    check(util::parseBool(trues[i], &v) && v, "%s", trues[i]);
  }
  for (int i = 0; falses[i]; ++i) {
    v = true;
    check(util::parseBool(falses[i], &v) && !v, "%s", falses[i]);
  }

  const char *bad[] = {"", "yes", "tRUE", "2", "on", 0};
  for (int i = 0; bad[i]; ++i) {
    check(!util::parseBool(bad[i], &v), "%s accepted", bad[i]);
  }
}

DEFINE(quoteRune)
{
  struct {
    uint32_t    rune;
    const char *want;
  } cases[] = {
    {'A', "\"A\""},
    {' ', "\" \""},
    {'"', "\"\\\"\""},
    {'\\', "\"\\\\\""},
    {'\n', "\"\\n\""},
    {'\t', "\"\\t\""},
    {'\a', "\"\\a\""},
    {0x00, "\"\\x00\""},
    {0x1B, "\"\\x1b\""},
    {0x7F, "\"\\x7f\""},
    {0x85, "\"\\u0085\""},
    {0xA0, "\"\\u00a0\""},
    {0xE9, "\"\xC3\xA9\""},
    {0x20AC, "\"\xE2\x82\xAC\""},
    {0x2028, "\"\\u2028\""},
    {0x1F600, "\"\xF0\x9F\x98\x80\""},
    {utf8::RUNE_ERROR, "\"\xEF\xBF\xBD\""},
    {0xD800, "\"\xEF\xBF\xBD\""},
    {0x110000, "\"\xEF\xBF\xBD\""},
    {0x3000, "\"\\u3000\""},
    {0x1680, "\"\\u1680\""},
    {0x202F, "\"\\u202f\""},
    {0x0378, "\"\\u0378\""},
    {0xE000, "\"\\ue000\""},
    {0xFDD0, "\"\\ufdd0\""},
    {0x1FFFE, "\"\\U0001fffe\""},
    {0x50000, "\"\\U00050000\""},
    {0xE0041, "\"\\U000e0041\""},
    {0x4E16, "\"\xE4\xB8\x96\""},
    {0x03A9, "\"\xCE\xA9\""},
    {0, 0}
  };

  for (int i = 0; cases[i].want; ++i) {
    std::string s = util::quoteRune(cases[i].rune);
    check(s == cases[i].want, "quote %x = %s, want %s", cases[i].rune, PTRS(s), cases[i].want);
  }
}

DEFINE(formatCodePoint)
{
  check(util::formatCodePoint('A') == "U+0041", "%s", PTRS(util::formatCodePoint('A')));
  check(util::formatCodePoint(0) == "U+0000", "%s", PTRS(util::formatCodePoint(0)));
  check(util::formatCodePoint(0x20AC) == "U+20AC", "%s", PTRS(util::formatCodePoint(0x20AC)));
  check(util::formatCodePoint(0x1F600) == "U+1F600", "%s", PTRS(util::formatCodePoint(0x1F600)));
}

DEFINE(decodeRune)
{
  struct {
    const char *bytes;
    uint32_t    rune;
    int         size;
  } cases[] = {
    {"A", 'A', 1},
    {"\xC2\xA2", 0xA2, 2},
    {"\xE2\x82\xAC", 0x20AC, 3},
    {"\xED\x95\x9C", 0xD55C, 3},
    {"\xF0\x90\x8D\x88", 0x10348, 4},
    {"\xF4\x8F\xBF\xBF", utf8::MAX_RUNE, 4},
    {"\xEF\xBF\xBD", utf8::RUNE_ERROR, 3},
    {"\x80", utf8::RUNE_ERROR, 1},            // stray continuation
    {"\xC0\x80", utf8::RUNE_ERROR, 1},        // overlong
    {"\xE0\x80\x80", utf8::RUNE_ERROR, 1},    // overlong
    {"\xED\xA0\x80", utf8::RUNE_ERROR, 1},    // surrogate
    {"\xF4\x90\x80\x80", utf8::RUNE_ERROR, 1},// above MAX_RUNE
    {"\xF8\x88\x80\x80", utf8::RUNE_ERROR, 1},
    {"\xE2\x82", utf8::RUNE_ERROR, 1},        // truncated
    {"\xE2" "A", utf8::RUNE_ERROR, 1},
    {0, 0, 0}
  };

  char hex[32];
  for (int i = 0; cases[i].bytes; ++i) {
    const char *bytes = cases[i].bytes;
    uint32_t rune = 0;
    int size = utf8::decodeRune(bytes, strlen(bytes), &rune);
    util::binToHex((const unsigned char *) bytes, strlen(bytes), hex);
    check(rune == cases[i].rune, "decode %s rune %x, want %x", hex, rune, cases[i].rune);
    check(size == cases[i].size, "decode %s size %d, want %d", hex, size, cases[i].size);
  }

  uint32_t rune;
  check(utf8::decodeRune("", 0, &rune) == 0, "empty input has a width");

  /* a NUL byte is a rune like any other */
  check(utf8::decodeRune("\0", 1, &rune) == 1 && rune == 0, "NUL rune %x", rune);
}

DEFINE(fullRune)
{
  check(!utf8::fullRune("", 0), "empty is full");
  check(utf8::fullRune("A", 1), "ascii not full");
  check(!utf8::fullRune("\xE2", 1), "lead byte alone is full");
  check(!utf8::fullRune("\xE2\x82", 2), "two of three is full");
  check(utf8::fullRune("\xE2\x82\xAC", 3), "three of three not full");
  check(!utf8::fullRune("\xF0\x9F\x98", 3), "three of four is full");
  check(utf8::fullRune("\x80", 1), "stray continuation waits for more");
  check(utf8::fullRune("\xFF", 1), "invalid lead waits for more");
  check(utf8::fullRune("\xE2" "A", 2), "broken sequence waits for more");
  check(utf8::fullRune("\xED\xA0", 2), "surrogate prefix waits for more");
}

DEFINE(encodeRune)
{
  char buffer[utf8::UTF_MAX];
  int n;

  n = utf8::encodeRune('A', buffer);
  check(n == 1 && buffer[0] == 'A', "A encodes to %d bytes", n);

  n = utf8::encodeRune(0x20AC, buffer);
  check(n == 3 && memcmp(buffer, "\xE2\x82\xAC", 3) == 0, "euro encodes to %d bytes", n);

  n = utf8::encodeRune(0x10348, buffer);
  check(n == 4 && memcmp(buffer, "\xF0\x90\x8D\x88", 4) == 0, "U+10348 encodes to %d bytes", n);

  n = utf8::encodeRune(0xDFFF, buffer);
  check(n == 3 && memcmp(buffer, utf8::RUNE_ERROR_BYTES, 3) == 0, "surrogate encodes to %d bytes", n);

  n = utf8::encodeRune(0x110000, buffer);
  check(n == 3 && memcmp(buffer, utf8::RUNE_ERROR_BYTES, 3) == 0, "out of range encodes to %d bytes", n);
}

int main()
{
  TEST(parseDuration);
  TEST(parseDurationError);
  TEST(formatDuration);
  TEST(parseUint);
  TEST(parseBool);
  TEST(quoteRune);
  TEST(formatCodePoint);

  TEST(decodeRune);
  TEST(fullRune);
  TEST(encodeRune);
  return 0;
}
