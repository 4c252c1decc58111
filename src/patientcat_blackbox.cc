#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <sys/time.h>

#include "logger.h"
#include "unittesthelper.h"
#include "common.h"

LOGGER_INIT();

static const char *BIN = "./patientcat";
static char errbuf[MAX_ERR_LEN];

/* printf's octal escapes keep the command free of raw bytes */
static std::string run(const char *input, const char *args, int *status)
{
  char cmd[1024];
  snprintf(cmd, sizeof(cmd), "printf '%s' | '%s' %s", input, BIN, args);

  std::string output;
  bool rc = shell(cmd, &output, status, errbuf);
  check(rc, "%s", errbuf);
  return output;
}

static long long millis()
{
  struct timeval tv;
  gettimeofday(&tv, 0);
  return (long long) tv.tv_sec * 1000 + tv.tv_usec / 1000;
}

DEFINE(copyAscii)
{
  int status;
  std::string output = run("AB", "-base 0 -step 0", &status);
  check(status == 0, "exit %d", status);
  check(output == "AB", "output %s", PTRS(output));
}

DEFINE(copyMultiByte)
{
  int status;
  std::string output = run("\\342\\202\\254x\\360\\237\\230\\200", "--base=0s --step=0s -bits 7", &status);
  check(status == 0, "exit %d", status);
  check(output == "\xE2\x82\xAC" "x\xF0\x9F\x98\x80", "output %s", PTRS(output));
}

DEFINE(copyInvalid)
{
  int status;
  std::string output = run("a\\377b", "-base 0 -step 0", &status);
  check(status == 0, "exit %d", status);
  check(output == "a\xEF\xBF\xBD" "b", "output %s", PTRS(output));
}

DEFINE(debugRecords)
{
  int status;
  std::string output = run("A\\n", "-debug -base 0 -step 1ms", &status);
  check(status == 0, "exit %d", status);
  check(output == "\"A\" U+0041 1ms\n\"\\n\" U+000A 2ms\n", "output %s", PTRS(output));
}

DEFINE(debugClosedOutput)
{
  /* nowhere to print the records is an error, not a silent run */
  int status;
  run("abc", "-debug -base 0 -step 0 >&- 2>/dev/null", &status);
  check(status != 0, "exit %d", status);
}

DEFINE(goStyleFlags)
{
  int status;
  std::string output = run("A", "-debug=true -base 0 -step 1ms -bits 0x7", &status);
  check(status == 0, "exit %d", status);
  check(output == "\"A\" U+0041 65ms\n", "output %s", PTRS(output));

  output = run("A", "-debug=false -base 0 -step 0 -bits 07", &status);
  check(status == 0, "exit %d", status);
  check(output == "A", "output %s", PTRS(output));

  output = run("A", "-debug=maybe 2>/dev/null", &status);
  check(status != 0, "exit %d", status);
  check(output.empty(), "output %s", PTRS(output));
}

DEFINE(pacing)
{
  int status;
  long long start = millis();
  std::string output = run("abc", "-base 50ms -step 0", &status);
  long long elapsed = millis() - start;

  check(status == 0, "exit %d", status);
  check(output == "abc", "output %s", PTRS(output));
  check(elapsed >= 150, "three runes at 50ms took %lldms", elapsed);
}

DEFINE(tooManyBits)
{
  int status;
  std::string output = run("A", "-bits 8 2>/dev/null", &status);
  check(status != 0, "exit %d", status);
  check(output.empty(), "output %s", PTRS(output));
}

DEFINE(badOption)
{
  const char *cases[] = {
    "-base 1x", "-step", "-bits -1", "-bits seven", "-nosuchflag", "extra", 0
  };

  for (int i = 0; cases[i]; ++i) {
    char args[128];
    snprintf(args, sizeof(args), "%s 2>/dev/null", cases[i]);

    int status;
    std::string output = run("A", args, &status);
    check(status != 0, "%s exit %d", cases[i], status);
    check(output.empty(), "%s output %s", cases[i], PTRS(output));
  }
}

DEFINE(help)
{
  int status;
  std::string output = run("", "-help", &status);
  check(status == 0, "exit %d", status);
  check(output.find("as slow as possible\n\n") == 0, "output %s", PTRS(output));
  check(output.find("-bits") != std::string::npos, "output %s", PTRS(output));
}

int main(int argc, char *argv[])
{
  if (argc > 1) BIN = argv[1];

  TEST(copyAscii);
  TEST(copyMultiByte);
  TEST(copyInvalid);
  TEST(debugRecords);
  TEST(debugClosedOutput);
  TEST(goStyleFlags);
  TEST(pacing);
  TEST(tooManyBits);
  TEST(badOption);
  TEST(help);
  return 0;
}
