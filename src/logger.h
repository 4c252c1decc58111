#ifndef _LOGGER_H_
#define _LOGGER_H_

#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <string>
#include <memory>
#include <stdint.h>
#include <stdarg.h>
#include <time.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/time.h>

#define LOGGER_INIT() Logger *Logger::defLogger = 0;

static const size_t ERR_STR = 4095;

static const int   DEBUG_INT = 2;
static const int   INFO_INT  = 3;
static const int   ERROR_INT = 4;
static const int   FATAL_INT = 5;

static const char *DEBUG_PTR = "DEBUG";
static const char *INFO_PTR  = "INFO";
static const char *ERROR_PTR = "ERROR";
static const char *FATAL_PTR = "FATAL";

/* stdout carries the data stream, so a logger without a file
 * writes to stderr */
class Logger {
public:
  enum Level { DEBUG, INFO, ERROR, FATAL };

  static Logger *defLogger;

  static Logger *create(const std::string &file, bool def = false) {
    if (def && defLogger) return defLogger;

    std::auto_ptr<Logger> logger(new Logger(file));
    if (logger->init()) {
      Logger *ptr = logger.release();
      if (def) defLogger = ptr;
      return ptr;
    } else {
      return 0;
    }
  }

  static void destroy() {
    delete defLogger;
    defLogger = 0;
  }

  ~Logger() {
    if (handle_ != -1 && handle_ != STDERR_FILENO) close(handle_);
  }

  void setLevel(Level level) {
    if (level == DEBUG) level_ = DEBUG_INT;
    else if (level == INFO) level_ = INFO_INT;
    else if (level == ERROR) level_ = ERROR_INT;
    else level_ = FATAL_INT;
  }

  bool debug(const char *file, int line, int eno, const char *fmt, ...) {
    if (level_ > DEBUG_INT) return true;

    va_list ap;
    va_start(ap, fmt);
    bool rc = log(DEBUG_INT, DEBUG_PTR, file, line, eno, fmt, ap);
    va_end(ap);
    return rc;
  }

  bool info(const char *file, int line, int eno, const char *fmt, ...) {
    if (level_ > INFO_INT) return true;

    va_list ap;
    va_start(ap, fmt);
    bool rc = log(INFO_INT, INFO_PTR, file, line, eno, fmt, ap);
    va_end(ap);
    return rc;
  }

  bool error(const char *file, int line, int eno, const char *fmt, ...) {
    if (level_ > ERROR_INT) return true;

    va_list ap;
    va_start(ap, fmt);
    bool rc = log(ERROR_INT, ERROR_PTR, file, line, eno, fmt, ap);
    va_end(ap);
    return rc;
  }

  bool fatal(const char *file, int line, int eno, const char *fmt, ...) {
    if (level_ > FATAL_INT) return true;

    va_list ap;
    va_start(ap, fmt);
    bool rc = log(FATAL_INT, FATAL_PTR, file, line, eno, fmt, ap);
    va_end(ap);
    return rc;
  }

private:
  Logger(const std::string &file) : handle_(-1), file_(file) {
#if _DEBUG_
    setLevel(DEBUG);
#else
    setLevel(INFO);
#endif
  }

  bool init() {
    if (file_.empty()) {
      handle_ = STDERR_FILENO;
      return true;
    }

    handle_ = open(file_.c_str(), O_WRONLY | O_APPEND | O_CREAT,
                   S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    return handle_ != -1;
  }

  static int microseconds() {
    struct timeval now;
    gettimeofday(&now, 0);
    return now.tv_usec;
  }

  bool log(int level, const char *levelPtr, const char *file, int line, int eno, const char *fmt, va_list ap) {
    struct tm ltm;
    time_t now = time(0);
    localtime_r(&now, &ltm);

    /* one more for '\n' */
    char errstr[ERR_STR + 1];
    size_t n = 0;

    int micros = level == DEBUG_INT ? microseconds() : 0;
    n = strftime(errstr, ERR_STR, "%Y-%m-%d %H:%M:%S ", &ltm);
    n += snprintf(errstr + n, ERR_STR - n, "[%s] #%d #%s@%d \"%d:%s\" ",
                  levelPtr, micros, file, line, eno, eno ? strerror(eno) : "");

    if (n < ERR_STR) n += vsnprintf(errstr + n, ERR_STR - n, fmt, ap);

    if (n >= ERR_STR) n = ERR_STR;
    errstr[n++] = '\n';

    return write(handle_, errstr, n) != -1;
  }

private:
  uint8_t level_;
  int handle_;
  std::string file_;
};

#define LOG_STDERR(level, eno, fmt, args...) do {          \
  time_t now__ = time(0);                                  \
  struct tm ltm__;                                         \
  localtime_r(&now__, &ltm__);                             \
  char timestr[64];                                        \
  strftime(timestr, 64, "[%Y-%m-%d %H:%M:%S]", &ltm__);    \
  fprintf(stderr, "%s [%s] #%s@%d \"%d:%s\" " fmt "\n",    \
          timestr, level, __FILE__, __LINE__,              \
          eno, eno ? strerror(eno) : "", ##args);          \
} while (0)

#define log_fatal(eno, fmt, args...) do {                                                \
  if (Logger::defLogger) Logger::defLogger->fatal(__FILE__, __LINE__, eno, fmt, ##args); \
  else LOG_STDERR("FATAL", eno, fmt, ##args);                                            \
} while (0)

#define log_error(eno, fmt, args...) do {                                                \
  if (Logger::defLogger) Logger::defLogger->error(__FILE__, __LINE__, eno, fmt, ##args); \
  else LOG_STDERR("ERROR", eno, fmt, ##args);                                            \
} while (0)

#define log_info(eno, fmt, args...)  do {                                                \
  if (Logger::defLogger) Logger::defLogger->info(__FILE__, __LINE__, eno, fmt, ##args);  \
  else LOG_STDERR("INFO",  eno, fmt, ##args);                                            \
} while (0)

# if _DEBUG_
#define log_debug(eno, fmt, args...) do {                                                \
  if (Logger::defLogger) Logger::defLogger->debug(__FILE__, __LINE__, eno, fmt, ##args); \
  else LOG_STDERR("DEBUG", eno, fmt, ##args);                                            \
} while (0)
# else
#define log_debug(eno, fmt, args...) do {                                                \
  if (Logger::defLogger) Logger::defLogger->debug(__FILE__, __LINE__, eno, fmt, ##args); \
} while (0)
# endif

#endif
