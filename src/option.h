#ifndef _OPTION_H_
#define _OPTION_H_

#include <cstdio>
#include <string>
#include "util.h"

#define DEFAULT_BASE  (1 * SECOND)
#define DEFAULT_STEP  (100 * MILLISECOND)
#define DEFAULT_BITS  3

/* startup parameters, fixed once parsed */
struct Option {
  bool     help;
  Duration base;
  Duration step;
  unsigned bits;
  bool     debug;
  bool     verbose;

  std::string logfile;

  /* returns 0 and fills errbuf on a bad command line */
  static Option *parse(int argc, char *argv[], char *errbuf);
};

void usage(FILE *output);

#endif
