#ifndef _UTF8_H_
#define _UTF8_H_

#include <cstddef>
#include <stdint.h>

namespace utf8 {

static const uint32_t RUNE_ERROR = 0xFFFD;   // U+FFFD replacement character
static const uint32_t RUNE_SELF  = 0x80;     // below this a rune is its own byte
static const uint32_t MAX_RUNE   = 0x10FFFF;
static const int      UTF_MAX    = 4;

/* RUNE_ERROR encoded */
static const char  RUNE_ERROR_BYTES[] = "\xEF\xBF\xBD";
static const size_t RUNE_ERROR_LEN    = 3;

const unsigned char B2_MASK = 0x1F; // 0001 1111
const unsigned char B3_MASK = 0x0F; // 0000 1111
const unsigned char B4_MASK = 0x07; // 0000 0111
const unsigned char MB_MASK = 0x3F; // 0011 1111

/* whether ptr begins with a complete encoding; an invalid
 * prefix counts as complete since no more bytes can fix it */
bool fullRune(const char *ptr, size_t len);

/* decode the first rune, returns its width in bytes. an invalid or
 * truncated sequence yields RUNE_ERROR with width 1, empty input 0 */
int decodeRune(const char *ptr, size_t len, uint32_t *rune);

/* buffer needs UTF_MAX bytes, invalid runes encode as RUNE_ERROR */
int encodeRune(uint32_t rune, char *buffer);

} // namespace utf8

#endif
