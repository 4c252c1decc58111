#include <cstring>
#include <errno.h>
#include <unistd.h>

#include "logger.h"
#include "sys.h"
#include "stream.h"

Flush Flush::make(Writer *writer)
{
  Flush flush;
  if ((flush.errFlusher_ = dynamic_cast<ErrFlusher *>(writer))) {
    flush.kind_ = ERR_FLUSH;
  } else if ((flush.flusher_ = dynamic_cast<Flusher *>(writer))) {
    flush.kind_ = FLUSH;
  } else if ((flush.syncer_ = dynamic_cast<Syncer *>(writer))) {
    flush.kind_ = SYNC;
  }
  return flush;
}

void Flush::operator()() const
{
  switch (kind_) {
  case ERR_FLUSH:
    if (!errFlusher_->flush()) log_debug(errno, "flush error ignored");
    break;
  case FLUSH:
    flusher_->flush();
    break;
  case SYNC:
    /* EINVAL for pipes and terminals */
    if (!syncer_->sync()) log_debug(errno, "sync error ignored");
    break;
  case NOOP:
    break;
  }
}

bool FdWriter::write(const char *ptr, size_t len)
{
  return sys::writeAll(fd_, ptr, len);
}

bool FdWriter::sync()
{
  return fsync(fd_) == 0;
}

bool FileWriter::write(const char *ptr, size_t len)
{
  clearerr(fp_);
  return fwrite(ptr, 1, len, fp_) == len;
}

bool FileWriter::flush()
{
  return fflush(fp_) == 0;
}

bool StringWriter::write(const char *ptr, size_t len)
{
  writes_.push_back(std::string(ptr, len));
  return true;
}

std::string StringWriter::str() const
{
  std::string s;
  for (std::vector<std::string>::const_iterator ite = writes_.begin(); ite != writes_.end(); ++ite) {
    s.append(*ite);
  }
  return s;
}

ssize_t FdReader::read(char *buffer, size_t len)
{
  ssize_t nn;
  while ((nn = ::read(fd_, buffer, len)) == -1 && errno == EINTR) {}
  return nn;
}

ssize_t StringReader::read(char *buffer, size_t len)
{
  size_t n = data_.size() - pos_;
  if (n > len) n = len;
  if (chunk_ > 0 && n > chunk_) n = chunk_;

  memcpy(buffer, data_.data() + pos_, n);
  pos_ += n;
  return n;
}
