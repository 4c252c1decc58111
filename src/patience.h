#ifndef _PATIENCE_H_
#define _PATIENCE_H_

#include <stdint.h>
#include "common.h"
#include "util.h"

class Writer;

/* decides how long to wait after a rune was written */
class Patience {
public:
  virtual ~Patience() {}
  virtual Duration delay(uint32_t rune) = 0;

  /* true and errbuf filled once a side effect of delay failed */
  virtual bool error(char *errbuf) const { return false; }
};

#define MAX_PATIENCE_BITS 7

/* base + step * (rune & mask), mask keeps the low bits bits of the rune */
class LinearPatience : public Patience {
public:
  /* bits > MAX_PATIENCE_BITS is a configuration error */
  static LinearPatience *create(unsigned bits, Duration base, Duration step, char *errbuf);

  /* wraps around like two's complement when base or step is huge */
  Duration delay(uint32_t rune) {
    return (Duration) ((uint64_t) base_ + (uint64_t) step_ * (mask_ & rune));
  }

  uint32_t mask() const { return mask_; }

private:
  LinearPatience(uint32_t mask, Duration base, Duration step)
    : mask_(mask), base_(base), step_(step) {}

  const uint32_t mask_;
  const Duration base_;
  const Duration step_;
};

/* prints every decision of the wrapped patience to writer as
 * "<quoted rune> <U+XXXX> <delay>", and returns it unchanged.
 * borrows both pointers */
class PrintingPatience : public Patience {
public:
  PrintingPatience(Writer *writer, Patience *patience)
    : writer_(writer), patience_(patience), failed_(false) {}

  Duration delay(uint32_t rune);
  bool error(char *errbuf) const;

private:
  Writer   *writer_;
  Patience *patience_;

  /* the first record that could not be written */
  bool failed_;
  char error_[MAX_ERR_LEN];
};

#endif
