#include <cstdio>
#include <cstring>
#include <string>
#include <errno.h>

#include "common.h"
#include "stream.h"
#include "patience.h"

LinearPatience *LinearPatience::create(unsigned bits, Duration base, Duration step, char *errbuf)
{
  /* the mask must fit one byte */
  if (bits > MAX_PATIENCE_BITS) {
    snprintf(errbuf, MAX_ERR_LEN, "too many bits %u, must be in [0,%d]", bits, MAX_PATIENCE_BITS);
    return 0;
  }

  uint32_t mask = (1U << bits) - 1;
  return new LinearPatience(mask, base, step);
}

Duration PrintingPatience::delay(uint32_t rune)
{
  Duration delay = patience_->delay(rune);

  std::string line = util::quoteRune(rune);
  line.append(1, ' ').append(util::formatCodePoint(rune));
  line.append(1, ' ').append(util::formatDuration(delay));
  line.append(1, '\n');

  if (!writer_->write(line.data(), line.size()) && !failed_) {
    snprintf(error_, MAX_ERR_LEN, "print %s error %d:%s",
             util::formatCodePoint(rune).c_str(), errno, strerror(errno));
    failed_ = true;
  }
  return delay;
}

bool PrintingPatience::error(char *errbuf) const
{
  if (!failed_) return false;
  snprintf(errbuf, MAX_ERR_LEN, "%s", error_);
  return true;
}
