#ifndef _COMMON_H
#define _COMMON_H

#include <stdint.h>

typedef uint8_t uint8;
typedef uint16_t uint16;
typedef uint32_t uint32;
typedef uint64_t uint64;

typedef int8_t int8;
typedef int16_t int16;
typedef int32_t int32;
typedef int64_t int64;

const int DEFAULT_WINDOW_WIDTH = 1024;
const int DEFAULT_WINDOW_HEIGHT = 768;
const int MAX_WINDOW_DIMENSION = 16384;

const int DEFAULT_FRAME_RATE = 60;
const int MAX_FRAME_RATE = 1000;

// Each texel is stored as 4 bytes, RGBA
const int TEXTURE_BYTES_PER_PIXEL = 4;

// Matches the GL_MAX_TEXTURE_SIZE most desktop drivers report, and keeps the byte
// count of the largest allowed texture (1GiB) representable as an int
const int MAX_TEXTURE_DIMENSION = 16384;

#endif
