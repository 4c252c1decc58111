#include "utf8.h"

namespace utf8 {

#define LOCB 0x80  // lowest continuation byte
#define HICB 0xBF  // highest continuation byte

/* width of the sequence b0 leads and the accepted range of its second byte,
 * false when b0 can not start a multi-byte sequence */
static bool leadByte(unsigned char b0, int *size, unsigned char *lo, unsigned char *hi)
{
  *lo = LOCB;
  *hi = HICB;

  if (b0 >= 0xC2 && b0 <= 0xDF) {
    *size = 2;
  } else if (b0 == 0xE0) {
    *size = 3;
    *lo = 0xA0;       // overlong
  } else if (b0 == 0xED) {
    *size = 3;
    *hi = 0x9F;       // surrogates
  } else if (b0 >= 0xE1 && b0 <= 0xEF) {
    *size = 3;
  } else if (b0 == 0xF0) {
    *size = 4;
    *lo = 0x90;       // overlong
  } else if (b0 >= 0xF1 && b0 <= 0xF3) {
    *size = 4;
  } else if (b0 == 0xF4) {
    *size = 4;
    *hi = 0x8F;       // above MAX_RUNE
  } else {
    return false;
  }
  return true;
}

inline bool continuation(unsigned char b)
{
  return b >= LOCB && b <= HICB;
}

bool fullRune(const char *ptr, size_t len)
{
  if (len == 0) return false;

  const unsigned char *p = (const unsigned char *) ptr;
  if (p[0] < RUNE_SELF) return true;

  int size;
  unsigned char lo, hi;
  if (!leadByte(p[0], &size, &lo, &hi)) return true;
  if ((int) len >= size) return true;

  if (len > 1 && (p[1] < lo || p[1] > hi)) return true;
  if (len > 2 && !continuation(p[2])) return true;
  return false;
}

int decodeRune(const char *ptr, size_t len, uint32_t *rune)
{
  if (len == 0) {
    *rune = RUNE_ERROR;
    return 0;
  }

  const unsigned char *p = (const unsigned char *) ptr;
  unsigned char b0 = p[0];
  if (b0 < RUNE_SELF) {
    *rune = b0;
    return 1;
  }

  *rune = RUNE_ERROR;

  int size;
  unsigned char lo, hi;
  if (!leadByte(b0, &size, &lo, &hi)) return 1;
  if ((int) len < size) return 1;

  unsigned char b1 = p[1];
  if (b1 < lo || b1 > hi) return 1;
  if (size == 2) {
    *rune = ((uint32_t) (b0 & B2_MASK)) << 6 | (uint32_t) (b1 & MB_MASK);
    return 2;
  }

  unsigned char b2 = p[2];
  if (!continuation(b2)) return 1;
  if (size == 3) {
    *rune = ((uint32_t) (b0 & B3_MASK)) << 12 | ((uint32_t) (b1 & MB_MASK)) << 6 |
      (uint32_t) (b2 & MB_MASK);
    return 3;
  }

  unsigned char b3 = p[3];
  if (!continuation(b3)) return 1;
  *rune = ((uint32_t) (b0 & B4_MASK)) << 18 | ((uint32_t) (b1 & MB_MASK)) << 12 |
    ((uint32_t) (b2 & MB_MASK)) << 6 | (uint32_t) (b3 & MB_MASK);
  return 4;
}

int encodeRune(uint32_t rune, char *buffer)
{
  unsigned char *p = (unsigned char *) buffer;

  if (rune < RUNE_SELF) {
    p[0] = rune;
    return 1;
  } else if (rune < 0x800) {
    p[0] = 0xC0 | (rune >> 6);
    p[1] = 0x80 | (rune & MB_MASK);
    return 2;
  }

  if (rune > MAX_RUNE || (rune >= 0xD800 && rune <= 0xDFFF)) rune = RUNE_ERROR;

  if (rune < 0x10000) {
    p[0] = 0xE0 | (rune >> 12);
    p[1] = 0x80 | ((rune >> 6) & MB_MASK);
    p[2] = 0x80 | (rune & MB_MASK);
    return 3;
  } else {
    p[0] = 0xF0 | (rune >> 18);
    p[1] = 0x80 | ((rune >> 12) & MB_MASK);
    p[2] = 0x80 | ((rune >> 6) & MB_MASK);
    p[3] = 0x80 | (rune & MB_MASK);
    return 4;
  }
}

} // namespace utf8
