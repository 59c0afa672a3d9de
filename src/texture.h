#ifndef _TEXTURE_H
#define _TEXTURE_H

#include "common.h"
#include "vecmath.h"

enum TextureError
{
    TEXTURE_OK,
    TEXTURE_ERROR_INVALID_SIZE,
    TEXTURE_ERROR_INVALID_DATA
};

// Mirrors the GL_TEXTURE_WRAP_S/T settings the host applies when uploading
enum TextureWrapMode
{
    WRAP_CLAMP_TO_EDGE,
    WRAP_REPEAT,
    WRAP_MIRRORED_REPEAT
};

const char* textureErrorString(TextureError error);
const char* textureWrapModeName(TextureWrapMode mode);

// CPU-side RGBA8 albedo image.
// Rows are stored top to bottom, row 0 is sampled at texture coordinate v=0.
// Sampling uses nearest filtering, the same as the textures the host uploads.
class Texture
{
public:
    Texture();
    ~Texture();

    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

    // Allocates zeroed storage, replacing any existing contents.
    // Fails without modifying the texture if either dimension is not positive or
    // exceeds MAX_TEXTURE_DIMENSION.
    TextureError create(int width, int height);

    // Replaces the whole image. dataLength must equal dataLength().
    TextureError updateData(int dataLength, const uint8* data);

    void setPixel(int x, int y, uint8 r, uint8 g, uint8 b, uint8 a);

    void setWrapMode(TextureWrapMode wrapS, TextureWrapMode wrapT);
    TextureWrapMode wrapS() const { return wrapModeS; }
    TextureWrapMode wrapT() const { return wrapModeT; }

    int width() const { return pixelWidth; }
    int height() const { return pixelHeight; }
    const uint8* data() const { return pixels; }

    // Number of bytes in the texture's storage
    int dataLength() const;

    // Returns the texel nearest to texCoord as normalized RGBA.
    // An uncreated texture samples as opaque black, as an incomplete GL texture does.
    Vector4 sample(Vector2 texCoord) const;

private:
    int pixelWidth;
    int pixelHeight;
    uint8* pixels;

    TextureWrapMode wrapModeS;
    TextureWrapMode wrapModeT;
};

#endif
