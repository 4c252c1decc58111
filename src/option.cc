#include <cstdio>
#include <cstring>
#include <memory>
#include <getopt.h>

#include "common.h"
#include "option.h"

/* a switch is on when given bare, -debug=false turns it off */
static bool flagValue(const char *name, const char *arg, bool *val, char *errbuf)
{
  if (!arg) {
    *val = true;
    return true;
  }
  if (!util::parseBool(arg, val)) {
    snprintf(errbuf, MAX_ERR_LEN, "invalid boolean value \"%s\" for -%s", arg, name);
    return false;
  }
  return true;
}

Option *Option::parse(int argc, char *argv[], char *errbuf)
{
  std::auto_ptr<Option> option(new Option);
  option->help    = false;
  option->base    = DEFAULT_BASE;
  option->step    = DEFAULT_STEP;
  option->bits    = DEFAULT_BITS;
  option->debug   = false;
  option->verbose = false;

  struct option longOptions[] = {
    {"help",    no_argument,       0, 'h'},
    {"base",    required_argument, 0, 'b'},
    {"step",    required_argument, 0, 's'},
    {"bits",    required_argument, 0, 'n'},
    {"debug",   optional_argument, 0, 'd'},
    {"log",     required_argument, 0, 'l'},
    {"verbose", optional_argument, 0, 'v'},
    {0, 0, 0, 0}
  };

  /* rescan from argv[1] on every call */
  optind = 0;
  opterr = 0;

  bool error = false;
  int opt;
  while (!error && (opt = getopt_long_only(argc, argv, ":h", longOptions, 0)) != -1) {
    switch (opt) {
    case 'h':
      option->help = true;
      break;
    case 'b':
      if (!util::parseDuration(optarg, &option->base, errbuf)) error = true;
      break;
    case 's':
      if (!util::parseDuration(optarg, &option->step, errbuf)) error = true;
      break;
    case 'n':
      if (!util::parseUint(optarg, &option->bits)) {
        snprintf(errbuf, MAX_ERR_LEN, "invalid value \"%s\" for -bits, an unsigned integer is required", optarg);
        error = true;
      }
      break;
    case 'd':
      if (!flagValue("debug", optarg, &option->debug, errbuf)) error = true;
      break;
    case 'l':
      option->logfile = optarg;
      break;
    case 'v':
      if (!flagValue("verbose", optarg, &option->verbose, errbuf)) error = true;
      break;
    case ':':
      snprintf(errbuf, MAX_ERR_LEN, "option %s needs an argument", argv[optind-1]);
      error = true;
      break;
    default:
      snprintf(errbuf, MAX_ERR_LEN, "unknown option %s", argv[optind-1]);
      error = true;
      break;
    }
  }

  if (!error && optind < argc) {
    snprintf(errbuf, MAX_ERR_LEN, "unexpected argument %s", argv[optind]);
    error = true;
  }

  if (error) return 0;
  return option.release();
}

void usage(FILE *output)
{
  fprintf(output,
          "as slow as possible\n"
          "\n"
          "Usage: patientcat [-h] [-help]\n"
          "                  [-base <duration>] [-step <duration>] [-bits <n>]\n"
          "                  [-debug] [-log <file>] [-verbose]\n"
          "\n"
          "  -base duration\n"
          "    \tthe base delay per character (default 1s)\n"
          "  -bits uint\n"
          "    \tthe number of bits per rune used to determine an appropriate delay (default 3)\n"
          "  -debug\n"
          "    \tprint the input character and the calculated delay instead of the output unmodified\n"
          "  -log file\n"
          "    \tappend log lines to file instead of stderr\n"
          "  -step duration\n"
          "    \tthe amount of proportional delay added per rune (default 100ms)\n"
          "  -verbose\n"
          "    \tlog every rune and its delay\n");
}
