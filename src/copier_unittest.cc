#include <cstdio>
#include <cstring>
#include <string>
#include <vector>
#include <memory>
#include <errno.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

#include "logger.h"
#include "unittesthelper.h"
#include "common.h"
#include "util.h"
#include "utf8.h"
#include "stream.h"
#include "patience.h"
#include "copier.h"

LOGGER_INIT();

static char errbuf[MAX_ERR_LEN];

class RecordSleeper : public Sleeper {
public:
  void sleep(Duration duration) { sleeps.push_back(duration); }
  std::vector<Duration> sleeps;
};

/* fails every write after the first n */
class FailWriter : public Writer {
public:
  FailWriter(size_t n) : n_(n) {}
  bool write(const char *ptr, size_t len) {
    if (writes.size() == n_) {
      errno = ENOSPC;
      return false;
    }
    writes.push_back(std::string(ptr, len));
    return true;
  }
  std::vector<std::string> writes;

private:
  size_t n_;
};

/* hands out data, then fails */
class FailReader : public Reader {
public:
  FailReader(const std::string &data) : data_(data), done_(false) {}
  ssize_t read(char *buffer, size_t len) {
    if (done_) {
      errno = EIO;
      return -1;
    }
    done_ = true;
    size_t n = data_.size() < len ? data_.size() : len;
    memcpy(buffer, data_.data(), n);
    return n;
  }

private:
  std::string data_;
  bool done_;
};

static std::string hex(const std::string &s)
{
  static char buffer[1024];
  if (s.size() * 2 >= sizeof(buffer)) return "...";
  return util::binToHex((const unsigned char *) s.data(), s.size(), buffer);
}

DEFINE(copyLossless)
{
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(3, 0, 0, errbuf));
  check(patience.get(), "create error %s", errbuf);

  StringWriter writer;
  StringReader reader("AB");
  RecordSleeper sleeper;
  PatientCopier copier(&writer, &reader, patience.get(), &sleeper);

  bool rc = copier.copy(errbuf);
  check(rc, "copy error %s", errbuf);
  check(writer.str() == "AB", "output %s", PTRS(writer.str()));
  check(writer.writes().size() == 2, "%d writes", (int) writer.writes().size());
  check(copier.runes() == 2, "%d runes", (int) copier.runes());
  check(sleeper.sleeps.size() == 2 && sleeper.sleeps[0] == 0 && sleeper.sleeps[1] == 0, "zero delays expected");
}

DEFINE(copyEmpty)
{
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(3, SECOND, SECOND, errbuf));
  check(patience.get(), "create error %s", errbuf);

  StringWriter writer;
  StringReader reader("");
  RecordSleeper sleeper;
  PatientCopier copier(&writer, &reader, patience.get(), &sleeper);

  check(copier.copy(errbuf), "copy error %s", errbuf);
  check(writer.writes().empty(), "%d writes", (int) writer.writes().size());
  check(writer.flushes() == 0, "%d flushes", writer.flushes());
  check(sleeper.sleeps.empty(), "%d sleeps", (int) sleeper.sleeps.size());
}

DEFINE(copyRuneAtomic)
{
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(3, 0, 0, errbuf));
  check(patience.get(), "create error %s", errbuf);

  StringWriter writer;
  StringReader reader("\xE2\x82\xAC" "A");
  RecordSleeper sleeper;
  PatientCopier copier(&writer, &reader, patience.get(), &sleeper);

  check(copier.copy(errbuf), "copy error %s", errbuf);

  const std::vector<std::string> &writes = writer.writes();
  check(writes.size() == 2, "%d writes", (int) writes.size());
  check(writes[0] == "\xE2\x82\xAC", "first write %s", PTRS(hex(writes[0])));
  check(writes[1] == "A", "second write %s", PTRS(hex(writes[1])));
}

DEFINE(copyRuneAcrossReads)
{
  std::string input("a\xC2\xA2" "b\xE2\x82\xAC" "c\xF0\x9F\x98\x80" "d");

  /* every cut point of the input, a rune is still written whole */
  for (size_t chunk = 1; chunk <= 5; ++chunk) {
    std::auto_ptr<LinearPatience> patience(LinearPatience::create(2, 0, 0, errbuf));
    check(patience.get(), "create error %s", errbuf);

    StringWriter writer;
    StringReader reader(input, chunk);
    RecordSleeper sleeper;
    PatientCopier copier(&writer, &reader, patience.get(), &sleeper);

    check(copier.copy(errbuf), "chunk %d copy error %s", (int) chunk, errbuf);
    check(writer.str() == input, "chunk %d output %s", (int) chunk, PTRS(hex(writer.str())));

    const std::vector<std::string> &writes = writer.writes();
    check(writes.size() == 7, "chunk %d %d writes", (int) chunk, (int) writes.size());
    check(writes[1] == "\xC2\xA2", "chunk %d write %s", (int) chunk, PTRS(hex(writes[1])));
    check(writes[3] == "\xE2\x82\xAC", "chunk %d write %s", (int) chunk, PTRS(hex(writes[3])));
    check(writes[5] == "\xF0\x9F\x98\x80", "chunk %d write %s", (int) chunk, PTRS(hex(writes[5])));
  }
}

DEFINE(copyLongInput)
{
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(0, 0, 0, errbuf));
  check(patience.get(), "create error %s", errbuf);

  /* runes straddle the internal buffer boundary */
  std::string input("x");
  while (input.size() < 10000) input.append("\xE2\x82\xAC");

  StringWriter writer;
  StringReader reader(input);
  RecordSleeper sleeper;
  PatientCopier copier(&writer, &reader, patience.get(), &sleeper);

  check(copier.copy(errbuf), "copy error %s", errbuf);
  check(writer.str() == input, "output differs, %d bytes", (int) writer.str().size());
  check(copier.runes() == 1 + (input.size() - 1) / 3, "%d runes", (int) copier.runes());
}

DEFINE(copyInvalidBytes)
{
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(3, 0, 0, errbuf));
  check(patience.get(), "create error %s", errbuf);

  /* a stray byte, then a sequence cut short by the end of input */
  StringWriter writer;
  StringReader reader("A\xFF" "B\xE2\x82");
  RecordSleeper sleeper;
  PatientCopier copier(&writer, &reader, patience.get(), &sleeper);

  check(copier.copy(errbuf), "copy error %s", errbuf);

  const std::vector<std::string> &writes = writer.writes();
  check(writes.size() == 5, "%d writes", (int) writes.size());
  check(writes[0] == "A", "%s", PTRS(hex(writes[0])));
  check(writes[1] == utf8::RUNE_ERROR_BYTES, "%s", PTRS(hex(writes[1])));
  check(writes[2] == "B", "%s", PTRS(hex(writes[2])));
  check(writes[3] == utf8::RUNE_ERROR_BYTES, "%s", PTRS(hex(writes[3])));
  check(writes[4] == utf8::RUNE_ERROR_BYTES, "%s", PTRS(hex(writes[4])));
}

DEFINE(copyDelayPerRune)
{
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(3, SECOND, 100 * MILLISECOND, errbuf));
  check(patience.get(), "create error %s", errbuf);

  StringWriter writer;
  StringReader reader("AB\xE2\x82\xAC");
  RecordSleeper sleeper;
  PatientCopier copier(&writer, &reader, patience.get(), &sleeper);

  check(copier.copy(errbuf), "copy error %s", errbuf);
  check(sleeper.sleeps.size() == 3, "%d sleeps", (int) sleeper.sleeps.size());
  check(sleeper.sleeps[0] == 1100 * MILLISECOND, "A %lld", (long long) sleeper.sleeps[0]);
  check(sleeper.sleeps[1] == 1200 * MILLISECOND, "B %lld", (long long) sleeper.sleeps[1]);
  check(sleeper.sleeps[2] == 1400 * MILLISECOND, "euro %lld", (long long) sleeper.sleeps[2]);
  check(writer.flushes() == 3, "%d flushes", writer.flushes());
}

DEFINE(copyWriteError)
{
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(3, SECOND, 0, errbuf));
  check(patience.get(), "create error %s", errbuf);

  FailWriter writer(2);
  StringReader reader("ABCDE");
  RecordSleeper sleeper;
  PatientCopier copier(&writer, &reader, patience.get(), &sleeper);

  errbuf[0] = '\0';
  bool rc = copier.copy(errbuf);
  check(!rc, "copy succeeded on a broken writer");
  check(strstr(errbuf, "U+0043") && strstr(errbuf, strerror(ENOSPC)), "errbuf %s", errbuf);

  /* C failed: nothing after it is written, and it is not waited for */
  check(writer.writes.size() == 2, "%d writes", (int) writer.writes.size());
  check(sleeper.sleeps.size() == 2, "%d sleeps", (int) sleeper.sleeps.size());
  check(copier.runes() == 2, "%d runes", (int) copier.runes());
}

DEFINE(copyReadError)
{
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(3, 0, 0, errbuf));
  check(patience.get(), "create error %s", errbuf);

  StringWriter writer;
  FailReader reader("AB");
  RecordSleeper sleeper;
  PatientCopier copier(&writer, &reader, patience.get(), &sleeper);

  errbuf[0] = '\0';
  bool rc = copier.copy(errbuf);
  check(!rc, "copy succeeded on a broken reader");
  check(strstr(errbuf, "read error") && strstr(errbuf, strerror(EIO)), "errbuf %s", errbuf);
  check(writer.str() == "AB", "what was read before the error is written, got %s", PTRS(writer.str()));
}

DEFINE(copyDebug)
{
  std::auto_ptr<LinearPatience> linear(LinearPatience::create(3, SECOND, 100 * MILLISECOND, errbuf));
  check(linear.get(), "create error %s", errbuf);

  StringWriter records;
  PrintingPatience printing(&records, linear.get());

  DiscardWriter discard;
  StringReader reader("A");
  RecordSleeper sleeper;
  PatientCopier copier(&discard, &reader, &printing, &sleeper);

  check(copier.copy(errbuf), "copy error %s", errbuf);
  check(copier.runes() == 1, "%d runes", (int) copier.runes());

  check(records.writes().size() == 1, "%d records", (int) records.writes().size());
  std::string want = "\"A\" U+0041 " + util::formatDuration(linear->delay('A')) + "\n";
  check(records.str() == want, "record %s", PTRS(records.str()));
  check(sleeper.sleeps.size() == 1 && sleeper.sleeps[0] == linear->delay('A'), "debug changed the pacing");
}

class BrokenWriter : public Writer {
public:
  bool write(const char *, size_t) {
    errno = EPIPE;
    return false;
  }
};

DEFINE(copyDebugRecordError)
{
  std::auto_ptr<LinearPatience> linear(LinearPatience::create(3, SECOND, 0, errbuf));
  check(linear.get(), "create error %s", errbuf);

  /* the records go nowhere, the copy stops at the first rune */
  BrokenWriter records;
  PrintingPatience printing(&records, linear.get());

  DiscardWriter discard;
  StringReader reader("ABC");
  RecordSleeper sleeper;
  PatientCopier copier(&discard, &reader, &printing, &sleeper);

  errbuf[0] = '\0';
  check(!copier.copy(errbuf), "copy succeeded without its records");
  check(strstr(errbuf, "print U+0041 error") && strstr(errbuf, strerror(EPIPE)), "errbuf %s", errbuf);
  check(copier.runes() == 1, "%d runes", (int) copier.runes());
  check(sleeper.sleeps.empty(), "%d sleeps", (int) sleeper.sleeps.size());
}

DEFINE(flushKind)
{
  StringWriter stringWriter;
  FileWriter   fileWriter(stdout);
  FdWriter     fdWriter(STDOUT_FILENO);
  DiscardWriter discard;

  check(Flush::make(&fileWriter).kind() == Flush::ERR_FLUSH, "FileWriter %d", Flush::make(&fileWriter).kind());
  check(Flush::make(&stringWriter).kind() == Flush::FLUSH, "StringWriter %d", Flush::make(&stringWriter).kind());
  check(Flush::make(&fdWriter).kind() == Flush::SYNC, "FdWriter %d", Flush::make(&fdWriter).kind());
  check(Flush::make(&discard).kind() == Flush::NOOP, "DiscardWriter %d", Flush::make(&discard).kind());

  /* a no-op flush is safe to call */
  Flush::make(&discard)();
}

/* a writer with every capability takes the fallible flush */
class EveryFlushWriter : public Writer, public ErrFlusher, public Syncer {
public:
  EveryFlushWriter() : flushes(0), syncs(0) {}
  bool write(const char *, size_t) { return true; }
  bool flush() { flushes++; return false; }
  bool sync() { syncs++; return true; }
  int flushes, syncs;
};

DEFINE(flushPriority)
{
  EveryFlushWriter writer;
  Flush flush = Flush::make(&writer);
  check(flush.kind() == Flush::ERR_FLUSH, "kind %d", flush.kind());

  flush();
  flush();
  check(writer.flushes == 2 && writer.syncs == 0, "flushes %d syncs %d", writer.flushes, writer.syncs);
}

/* checks, whenever the copier waits, that the file already holds every rune */
class VisibleSleeper : public Sleeper {
public:
  VisibleSleeper(int fd) : fd_(fd) {}
  void sleep(Duration) {
    struct stat st;
    check(fstat(fd_, &st) == 0, "fstat error %s", strerror(errno));
    sizes.push_back(st.st_size);
  }
  std::vector<off_t> sizes;

private:
  int fd_;
};

DEFINE(flushBeforeDelay)
{
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(3, 0, 0, errbuf));
  check(patience.get(), "create error %s", errbuf);

  FILE *fp = tmpfile();
  check(fp, "tmpfile error %s", strerror(errno));

  FileWriter writer(fp);
  StringReader reader("ab\xE2\x82\xAC");
  VisibleSleeper sleeper(fileno(fp));
  PatientCopier copier(&writer, &reader, patience.get(), &sleeper);

  check(copier.copy(errbuf), "copy error %s", errbuf);
  check(sleeper.sizes.size() == 3, "%d sleeps", (int) sleeper.sizes.size());
  check(sleeper.sizes[0] == 1, "after a %d bytes", (int) sleeper.sizes[0]);
  check(sleeper.sizes[1] == 2, "after b %d bytes", (int) sleeper.sizes[1]);
  check(sleeper.sizes[2] == 5, "after euro %d bytes", (int) sleeper.sizes[2]);

  fclose(fp);
}

DEFINE(copyFd)
{
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(3, 0, 0, errbuf));
  check(patience.get(), "create error %s", errbuf);

  int in[2], out[2];
  check(pipe(in) == 0 && pipe(out) == 0, "pipe error %s", strerror(errno));

  const char *data = "h\xC3\xA9llo\n";
  check(write(in[1], data, strlen(data)) == (ssize_t) strlen(data), "pipe write error %s", strerror(errno));
  close(in[1]);

  /* sync on a pipe fails with EINVAL and must not stop the copy */
  FdWriter writer(out[1]);
  FdReader reader(in[0]);
  check(copyRunesWithPatience(&writer, &reader, patience.get(), errbuf), "copy error %s", errbuf);
  close(out[1]);
  close(in[0]);

  char buffer[64];
  ssize_t nn = read(out[0], buffer, sizeof(buffer));
  close(out[0]);
  check(nn == (ssize_t) strlen(data) && memcmp(buffer, data, nn) == 0, "pipe output %d bytes", (int) nn);
}

DEFINE(copyFdClosedReader)
{
  std::auto_ptr<LinearPatience> patience(LinearPatience::create(3, 0, 0, errbuf));
  check(patience.get(), "create error %s", errbuf);
  check(signal(SIGPIPE, SIG_IGN) != SIG_ERR, "ignore SIGPIPE error %s", strerror(errno));

  int out[2];
  check(pipe(out) == 0, "pipe error %s", strerror(errno));
  close(out[0]);

  FdWriter writer(out[1]);
  StringReader reader("AB");
  RecordSleeper sleeper;
  PatientCopier copier(&writer, &reader, patience.get(), &sleeper);

  errbuf[0] = '\0';
  check(!copier.copy(errbuf), "copy to a closed pipe succeeded");
  check(strstr(errbuf, strerror(EPIPE)), "errbuf %s", errbuf);
  check(sleeper.sleeps.empty(), "%d sleeps", (int) sleeper.sleeps.size());
  close(out[1]);
}

int main()
{
  TEST(copyLossless);
  TEST(copyEmpty);
  TEST(copyRuneAtomic);
  TEST(copyRuneAcrossReads);
  TEST(copyLongInput);
  TEST(copyInvalidBytes);
  TEST(copyDelayPerRune);
  TEST(copyWriteError);
  TEST(copyReadError);
  TEST(copyDebug);
  TEST(copyDebugRecordError);

  TEST(flushKind);
  TEST(flushPriority);
  TEST(flushBeforeDelay);

  TEST(copyFd);
  TEST(copyFdClosedReader);
  return 0;
}
