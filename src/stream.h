#ifndef _STREAM_H_
#define _STREAM_H_

#include <cstdio>
#include <string>
#include <vector>
#include <sys/types.h>

/* all writers write the whole buffer or fail with errno set */
class Writer {
public:
  virtual ~Writer() {}
  virtual bool write(const char *ptr, size_t len) = 0;
};

/* returns bytes read, 0 on eof, -1 with errno set */
class Reader {
public:
  virtual ~Reader() {}
  virtual ssize_t read(char *buffer, size_t len) = 0;
};

/* optional writer capabilities, probed by Flush::make */
class ErrFlusher {
public:
  virtual ~ErrFlusher() {}
  virtual bool flush() = 0;
};

class Flusher {
public:
  virtual ~Flusher() {}
  virtual void flush() = 0;
};

class Syncer {
public:
  virtual ~Syncer() {}
  virtual bool sync() = 0;
};

/* the flush action bound to one writer. a failed flush or sync
 * is ignored, it costs visibility not data */
class Flush {
public:
  enum Kind { ERR_FLUSH, FLUSH, SYNC, NOOP };
  static Flush make(Writer *writer);

  void operator()() const;
  Kind kind() const { return kind_; }

private:
  Flush() : kind_(NOOP), errFlusher_(0), flusher_(0), syncer_(0) {}

  Kind        kind_;
  ErrFlusher *errFlusher_;
  Flusher    *flusher_;
  Syncer     *syncer_;
};

class FdWriter : public Writer, public Syncer {
public:
  FdWriter(int fd) : fd_(fd) {}
  bool write(const char *ptr, size_t len);
  bool sync();

private:
  int fd_;
};

class FileWriter : public Writer, public ErrFlusher {
public:
  FileWriter(FILE *fp) : fp_(fp) {}
  bool write(const char *ptr, size_t len);
  bool flush();

private:
  FILE *fp_;
};

class DiscardWriter : public Writer {
public:
  bool write(const char *, size_t) { return true; }
};

/* keeps every write call apart, so callers can see how output was cut */
class StringWriter : public Writer, public Flusher {
public:
  StringWriter() : flushes_(0) {}
  bool write(const char *ptr, size_t len);
  void flush() { flushes_++; }

  std::string str() const;
  const std::vector<std::string> &writes() const { return writes_; }
  int flushes() const { return flushes_; }

private:
  std::vector<std::string> writes_;
  int flushes_;
};

class FdReader : public Reader {
public:
  FdReader(int fd) : fd_(fd) {}
  ssize_t read(char *buffer, size_t len);

private:
  int fd_;
};

/* chunk > 0 caps every read, to cut input at arbitrary points */
class StringReader : public Reader {
public:
  StringReader(const std::string &data, size_t chunk = 0)
    : data_(data), pos_(0), chunk_(chunk) {}
  ssize_t read(char *buffer, size_t len);

private:
  std::string data_;
  size_t      pos_;
  size_t      chunk_;
};

#endif
