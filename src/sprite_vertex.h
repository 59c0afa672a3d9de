#ifndef _SPRITE_VERTEX_H
#define _SPRITE_VERTEX_H

#include <stddef.h>

#include "common.h"
#include "sprite_shader.h"
#include "vecmath.h"

// Interleaved layout uploaded to the vertex buffer. The attribute locations for each
// member are ShaderBinding::POSITION/TEXCOORD/COLOR_LOCATION.
struct SpriteVertex
{
    Vector2 position;
    Vector2 texCoord;
    Vector4 color;
};

const int SPRITE_QUAD_VERTEX_COUNT = 4;
const int SPRITE_QUAD_INDEX_COUNT = 6;

const size_t SPRITE_VERTEX_STRIDE = sizeof(SpriteVertex);
const size_t SPRITE_VERTEX_POSITION_OFFSET = offsetof(SpriteVertex, position);
const size_t SPRITE_VERTEX_TEXCOORD_OFFSET = offsetof(SpriteVertex, texCoord);
const size_t SPRITE_VERTEX_COLOR_OFFSET = offsetof(SpriteVertex, color);

// Fills a pixel-space rectangle with its top-left corner at position.
// Corners are emitted top-left, bottom-left, bottom-right, top-right and the two
// triangles are 0,1,2 and 0,2,3. Pixel rows grow downwards, so after the vertex
// stage flips Y both triangles are counter-clockwise in clip space.
void makeSpriteQuad(Vector2 position, Vector2 size, Vector4 color,
                    SpriteVertex* vertices, uint16* indices);

// Top-left corner that centres a rectangle of the given size in the viewport.
// The result is negative on an axis where the rectangle is larger than the viewport.
Vector2 centeredSpritePosition(Vector2 size, int viewportWidth, int viewportHeight);

VertexInput vertexInputFromSpriteVertex(const SpriteVertex& vertex);

#endif
