#ifndef _COPIER_H_
#define _COPIER_H_

#include <cstddef>
#include "util.h"

class Writer;
class Reader;
class Patience;
class Flush;

class Sleeper {
public:
  virtual ~Sleeper() {}
  virtual void sleep(Duration duration) = 0;
};

class SysSleeper : public Sleeper {
public:
  void sleep(Duration duration);
};

/* copies reader to writer one rune at a time: write the rune's bytes,
 * flush, then sleep for what patience says. the first write, read or
 * patience error ends the copy. nothing is owned */
class PatientCopier {
public:
  PatientCopier(Writer *writer, Reader *reader, Patience *patience, Sleeper *sleeper);
  ~PatientCopier();

  bool copy(char *errbuf);

  size_t runes() const { return runes_; }

private:
  PatientCopier(const PatientCopier &);
  PatientCopier &operator=(const PatientCopier &);

  bool copyRune(const Flush &flush, const char *ptr, size_t len, uint32_t rune, char *errbuf);

private:
  Writer   *writer_;
  Reader   *reader_;
  Patience *patience_;
  Sleeper  *sleeper_;

  char   *buffer_;
  size_t  runes_;
};

bool copyRunesWithPatience(Writer *writer, Reader *reader, Patience *patience, char *errbuf);

#endif
