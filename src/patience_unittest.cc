#include <cstdio>
#include <cstring>
#include <string>
#include <set>
#include <memory>
#include <errno.h>

#include "logger.h"
#include "unittesthelper.h"
#include "common.h"
#include "util.h"
#include "stream.h"
#include "patience.h"

LOGGER_INIT();

static char errbuf[MAX_ERR_LEN];

DEFINE(linearPatienceValues)
{
  const Duration base = 1 * SECOND;
  const Duration step = 100 * MILLISECOND;

  for (unsigned bits = 0; bits <= MAX_PATIENCE_BITS; ++bits) {
    std::auto_ptr<LinearPatience> patience(LinearPatience::create(bits, base, step, errbuf));
    check(patience.get(), "create bits=%u error %s", bits, errbuf);
    check(patience->mask() == (1U << bits) - 1, "bits=%u mask 0x%x", bits, patience->mask());

    /* every value base + step*k, k < 2^bits, and all of them show up */
    std::set<Duration> seen;
    for (uint32_t rune = 0; rune < 0x800; ++rune) {
      Duration d = patience->delay(rune);
      check(d >= base && (d - base) % step == 0, "bits=%u rune %x delay %lld", bits, rune, (long long) d);
      check((d - base) / step < (1 << bits), "bits=%u rune %x delay %lld", bits, rune, (long long) d);
      seen.insert(d);
    }
    check(seen.size() == (1U << bits), "bits=%u %d distinct delays", bits, (int) seen.size());
  }
}

DEFINE(linearPatienceTooManyBits)
{
  unsigned cases[] = { 8, 9, 31, 32, 1000 };
  for (size_t i = 0; i < sizeof(cases)/sizeof(cases[0]); ++i) {
    errbuf[0] = '\0';
    LinearPatience *patience = LinearPatience::create(cases[i], SECOND, MILLISECOND, errbuf);
    check(patience == 0, "bits=%u accepted", cases[i]);
    check(strstr(errbuf, "too many bits"), "bits=%u errbuf %s", cases[i], errbuf);
  }
}

DEFINE(linearPatienceMaskHighRunes)
{
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(3, SECOND, 100 * MILLISECOND, errbuf));
  check(patience.get(), "create error %s", errbuf);

  /* only the low bits count, however large the code point */
  check(patience->delay('A') == 1100 * MILLISECOND, "A %lld", (long long) patience->delay('A'));
  check(patience->delay(0x20AC) == 1400 * MILLISECOND, "euro %lld", (long long) patience->delay(0x20AC));
  check(patience->delay(0x1F600) == SECOND, "U+1F600 %lld", (long long) patience->delay(0x1F600));
  check(patience->delay(0x10FFFF) == 1700 * MILLISECOND, "max %lld", (long long) patience->delay(0x10FFFF));
  check(patience->delay(0x100 | 'A') == patience->delay('A'), "bits above the mask change the delay");
}

DEFINE(linearPatiencePure)
{
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(5, 3 * MILLISECOND, 7 * MICROSECOND, errbuf));
  check(patience.get(), "create error %s", errbuf);

  for (uint32_t rune = 0; rune < 0x300; ++rune) {
    Duration first = patience->delay(rune);
    check(patience->delay(rune) == first, "rune %x changed its delay", rune);
  }

  std::auto_ptr<LinearPatience> zero(LinearPatience::create(0, 0, SECOND, errbuf));
  check(zero.get(), "create error %s", errbuf);
  check(zero->delay('z') == 0, "bits=0 delay %lld", (long long) zero->delay('z'));
}

DEFINE(linearPatienceWraps)
{
  /* 2000000h * 127 does not fit 64 bits, the result wraps */
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(7, 0, 2000000 * HOUR, errbuf));
  check(patience.get(), "create error %s", errbuf);
  check(patience->delay(0x7F) == -7937203685477580800LL, "delay %lld", (long long) patience->delay(0x7F));

  std::auto_ptr<LinearPatience> top(LinearPatience::create(1, INT64_MAX, 1, errbuf));
  check(top.get(), "create error %s", errbuf);
  check(top->delay('A') == INT64_MIN, "delay %lld", (long long) top->delay('A'));
  check(top->delay('B') == INT64_MAX, "delay %lld", (long long) top->delay('B'));
}

DEFINE(printingPatienceSameDelay)
{
  std::auto_ptr<LinearPatience> linear(LinearPatience::create(4, 250 * MILLISECOND, 30 * MILLISECOND, errbuf));
  check(linear.get(), "create error %s", errbuf);

  StringWriter writer;
  PrintingPatience printing(&writer, linear.get());

  uint32_t runes[] = { 'A', 'z', '\n', 0x20AC, 0x1F600, 0xFFFD };
  size_t n = sizeof(runes)/sizeof(runes[0]);
  for (size_t i = 0; i < n; ++i) {
    Duration want = linear->delay(runes[i]);
    Duration d = printing.delay(runes[i]);
    check(d == want, "rune %x printed %lld, inner %lld", runes[i], (long long) d, (long long) want);
  }

  check(writer.writes().size() == n, "%d records", (int) writer.writes().size());
}

DEFINE(printingPatienceRecord)
{
  std::auto_ptr<LinearPatience> linear(LinearPatience::create(3, SECOND, 100 * MILLISECOND, errbuf));
  check(linear.get(), "create error %s", errbuf);

  StringWriter writer;
  PrintingPatience printing(&writer, linear.get());

  printing.delay('A');
  printing.delay('\n');
  printing.delay(0x20AC);

  const std::vector<std::string> &writes = writer.writes();
  check(writes.size() == 3, "%d records", (int) writes.size());
  check(writes[0] == "\"A\" U+0041 1.1s\n", "%s", PTRS(writes[0]));
  check(writes[1] == "\"\\n\" U+000A 1.2s\n", "%s", PTRS(writes[1]));
  check(writes[2] == "\"\xE2\x82\xAC\" U+20AC 1.4s\n", "%s", PTRS(writes[2]));
}

class BrokenWriter : public Writer {
public:
  bool write(const char *, size_t) {
    errno = EIO;
    return false;
  }
};

DEFINE(printingPatienceWriteError)
{
  std::auto_ptr<LinearPatience> linear(LinearPatience::create(3, SECOND, 100 * MILLISECOND, errbuf));
  check(linear.get(), "create error %s", errbuf);

  /* a lost record does not change the pacing, and is remembered */
  BrokenWriter writer;
  PrintingPatience printing(&writer, linear.get());
  check(!printing.error(errbuf), "error before any record %s", errbuf);

  check(printing.delay('A') == 1100 * MILLISECOND, "delay %lld", (long long) printing.delay('A'));
  check(printing.error(errbuf), "lost record not reported");
  check(strstr(errbuf, "print U+0041 error") && strstr(errbuf, strerror(EIO)), "errbuf %s", errbuf);

  /* the first failure is kept */
  printing.delay('B');
  check(printing.error(errbuf) && strstr(errbuf, "U+0041"), "errbuf %s", errbuf);

  StringWriter good;
  PrintingPatience fine(&good, linear.get());
  fine.delay('A');
  check(!fine.error(errbuf), "error on a good writer %s", errbuf);
}

int main()
{
  TEST(linearPatienceValues);
  TEST(linearPatienceTooManyBits);
  TEST(linearPatienceMaskHighRunes);
  TEST(linearPatiencePure);
  TEST(linearPatienceWraps);
  TEST(printingPatienceSameDelay);
  TEST(printingPatienceRecord);
  TEST(printingPatienceWriteError);
  return 0;
}
