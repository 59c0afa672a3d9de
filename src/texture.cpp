#include <assert.h>
#include <math.h>
#include <string.h>

#include "logging.h"
#include "texture.h"

static int positiveModulo(int x, int n)
{
    int result = x % n;
    if(result < 0)
    {
        result += n;
    }
    return result;
}

// Follows the nearest-texel selection and wrap rules of OpenGL 4.6, section 8.14.2
static int wrapTexelIndex(float coord, int size, TextureWrapMode mode)
{
    if(!isfinite(coord))
    {
        coord = 0.0f;
    }

    if(mode == WRAP_CLAMP_TO_EDGE)
    {
        coord = clampf(coord, 0.0f, 1.0f);
        int texel = (int)floorf(coord * (float)size);
        return clamp(texel, 0, size-1);
    }

    // Both repeating modes have a period that divides 2, so reduce into [0,2) before
    // scaling to keep the integer conversion in range.
    coord = coord - 2.0f*floorf(coord*0.5f);
    int texel = (int)floorf(coord * (float)size);

    if(mode == WRAP_REPEAT)
    {
        return positiveModulo(texel, size);
    }

    int mirrorInput = positiveModulo(texel, 2*size) - size;
    int mirrored = (mirrorInput >= 0) ? mirrorInput : -(1 + mirrorInput);
    return (size - 1) - mirrored;
}

static size_t texelOffset(int x, int y, int width)
{
    return TEXTURE_BYTES_PER_PIXEL*((size_t)y*(size_t)width + (size_t)x);
}

const char* textureErrorString(TextureError error)
{
    switch(error)
    {
    case TEXTURE_OK:
        return "No error";
    case TEXTURE_ERROR_INVALID_SIZE:
        return "Invalid texture size, ensure that neither dimension is zero or too large";
    case TEXTURE_ERROR_INVALID_DATA:
        return "Image data does not match texture storage size";
    }
    return "Unrecognized texture error";
}

const char* textureWrapModeName(TextureWrapMode mode)
{
    switch(mode)
    {
    case WRAP_CLAMP_TO_EDGE:
        return "clamp";
    case WRAP_REPEAT:
        return "repeat";
    case WRAP_MIRRORED_REPEAT:
        return "mirror";
    }
    return "unknown";
}

Texture::Texture()
    : pixelWidth(0), pixelHeight(0), pixels(nullptr),
      wrapModeS(WRAP_CLAMP_TO_EDGE), wrapModeT(WRAP_CLAMP_TO_EDGE)
{
}

Texture::~Texture()
{
    delete[] pixels;
}

TextureError Texture::create(int width, int height)
{
    if((width <= 0) || (height <= 0) ||
       (width > MAX_TEXTURE_DIMENSION) || (height > MAX_TEXTURE_DIMENSION))
    {
        logWarn("Invalid texture size (%d, %d)\n", width, height);
        return TEXTURE_ERROR_INVALID_SIZE;
    }

    delete[] pixels;
    pixelWidth = width;
    pixelHeight = height;
    pixels = new uint8[dataLength()];
    memset(pixels, 0, dataLength());
    return TEXTURE_OK;
}

TextureError Texture::updateData(int length, const uint8* data)
{
    if((pixels == nullptr) || (length != dataLength()) || (data == nullptr))
    {
        logWarn("Image data does not match texture storage size. Expected %d bytes, got %d\n",
                dataLength(), length);
        return TEXTURE_ERROR_INVALID_DATA;
    }

    memcpy(pixels, data, length);
    return TEXTURE_OK;
}

void Texture::setPixel(int x, int y, uint8 r, uint8 g, uint8 b, uint8 a)
{
    assert((x >= 0) && (x < pixelWidth));
    assert((y >= 0) && (y < pixelHeight));

    uint8* texel = pixels + texelOffset(x, y, pixelWidth);
    texel[0] = r;
    texel[1] = g;
    texel[2] = b;
    texel[3] = a;
}

void Texture::setWrapMode(TextureWrapMode wrapS, TextureWrapMode wrapT)
{
    wrapModeS = wrapS;
    wrapModeT = wrapT;
}

int Texture::dataLength() const
{
    // create() bounds both dimensions so this fits in an int
    return (int)((size_t)pixelWidth * (size_t)pixelHeight * TEXTURE_BYTES_PER_PIXEL);
}

Vector4 Texture::sample(Vector2 texCoord) const
{
    if(pixels == nullptr)
    {
        return Vector4(0.0f, 0.0f, 0.0f, 1.0f);
    }

    int x = wrapTexelIndex(texCoord.x, pixelWidth, wrapModeS);
    int y = wrapTexelIndex(texCoord.y, pixelHeight, wrapModeT);

    const uint8* texel = pixels + texelOffset(x, y, pixelWidth);
    return Vector4(texel[0]/255.0f, texel[1]/255.0f, texel[2]/255.0f, texel[3]/255.0f);
}
