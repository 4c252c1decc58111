#include <cstdio>
#include <cstring>
#include <errno.h>

#include "common.h"
#include "logger.h"
#include "sys.h"
#include "utf8.h"
#include "stream.h"
#include "patience.h"
#include "copier.h"

#define BUFFER_SIZE 4096

void SysSleeper::sleep(Duration duration)
{
  sys::sleep(duration);
}

PatientCopier::PatientCopier(Writer *writer, Reader *reader, Patience *patience, Sleeper *sleeper)
  : writer_(writer), reader_(reader), patience_(patience), sleeper_(sleeper), runes_(0)
{
  buffer_ = new char[BUFFER_SIZE];
}

PatientCopier::~PatientCopier()
{
  delete[] buffer_;
}

bool PatientCopier::copy(char *errbuf)
{
  Flush flush = Flush::make(writer_);

  /* bytes of an incomplete rune wait at the head of buffer_ for the next read */
  size_t npos = 0;
  for ( ;; ) {
    ssize_t nn = reader_->read(buffer_ + npos, BUFFER_SIZE - npos);
    if (nn == -1) {
      snprintf(errbuf, MAX_ERR_LEN, "read error %d:%s", errno, strerror(errno));
      return false;
    }

    bool eof = nn == 0;
    npos += nn;

    size_t pos = 0;
    while (pos < npos) {
      const char *ptr = buffer_ + pos;
      size_t left = npos - pos;
      if (!eof && !utf8::fullRune(ptr, left)) break;

      uint32_t rune;
      int size = utf8::decodeRune(ptr, left, &rune);

      bool rc;
      if (rune == utf8::RUNE_ERROR && size == 1) {
        rc = copyRune(flush, utf8::RUNE_ERROR_BYTES, utf8::RUNE_ERROR_LEN, rune, errbuf);
      } else {
        rc = copyRune(flush, ptr, size, rune, errbuf);
      }
      if (!rc) return false;

      pos += size;
    }

    if (eof) return true;

    memmove(buffer_, buffer_ + pos, npos - pos);
    npos -= pos;
  }
}

bool PatientCopier::copyRune(const Flush &flush, const char *ptr, size_t len, uint32_t rune, char *errbuf)
{
  if (!writer_->write(ptr, len)) {
    snprintf(errbuf, MAX_ERR_LEN, "write %s error %d:%s",
             util::formatCodePoint(rune).c_str(), errno, strerror(errno));
    return false;
  }
  runes_++;

  flush();

  Duration delay = patience_->delay(rune);
  if (patience_->error(errbuf)) return false;

  log_debug(0, "rune %s delay %s", util::formatCodePoint(rune).c_str(),
            util::formatDuration(delay).c_str());
  sleeper_->sleep(delay);
  return true;
}

bool copyRunesWithPatience(Writer *writer, Reader *reader, Patience *patience, char *errbuf)
{
  SysSleeper sleeper;
  PatientCopier copier(writer, reader, patience, &sleeper);
  return copier.copy(errbuf);
}
