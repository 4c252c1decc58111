#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <errno.h>
#include <signal.h>
#include <unistd.h>

#include "common.h"
#include "logger.h"
#include "sys.h"
#include "option.h"
#include "stream.h"
#include "patience.h"
#include "copier.h"

LOGGER_INIT();

int main(int argc, char *argv[])
{
  char errbuf[MAX_ERR_LEN] = {0};

  std::auto_ptr<Option> option(Option::parse(argc, argv, errbuf));
  if (!option.get()) {
    fprintf(stderr, "%s\n\n", errbuf);
    usage(stderr);
    return EXIT_FAILURE;
  }

  if (option->help) {
    usage(stdout);
    return EXIT_SUCCESS;
  }

  Logger *logger = Logger::create(option->logfile, true);
  if (!logger) {
    fprintf(stderr, "%d:%s init logger %s error\n", errno, strerror(errno), option->logfile.c_str());
    return EXIT_FAILURE;
  }
  if (option->verbose) logger->setLevel(Logger::DEBUG);

  std::auto_ptr<LinearPatience> linear(LinearPatience::create(option->bits, option->base, option->step, errbuf));
  if (!linear.get()) {
    log_fatal(0, "%s", errbuf);
    Logger::destroy();
    return EXIT_FAILURE;
  }

  log_debug(0, "patientcat start base=%s step=%s bits=%u mask=0x%02x debug=%s",
           util::formatDuration(option->base).c_str(), util::formatDuration(option->step).c_str(),
           option->bits, linear->mask(), option->debug ? "on" : "off");

  /* a vanished reader must come back as EPIPE, not kill us */
  if (!sys::ignoreSignal(SIGPIPE, errbuf)) {
    log_fatal(0, "%s", errbuf);
    Logger::destroy();
    return EXIT_FAILURE;
  }

  FdReader      stdinReader(STDIN_FILENO);
  FdWriter      stdoutWriter(STDOUT_FILENO);
  DiscardWriter discard;

  Writer   *dst = &stdoutWriter;
  Patience *patience = linear.get();

  std::auto_ptr<PrintingPatience> printing;
  if (option->debug) {
    printing.reset(new PrintingPatience(&stdoutWriter, linear.get()));
    dst = &discard;
    patience = printing.get();
  }

  int rc = EXIT_SUCCESS;
  if (!copyRunesWithPatience(dst, &stdinReader, patience, errbuf)) {
    log_fatal(0, "copy error %s", errbuf);
    rc = EXIT_FAILURE;
  } else {
    log_debug(0, "patientcat exit");
  }

  Logger::destroy();
  return rc;
}
