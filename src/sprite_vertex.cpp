#include "sprite_vertex.h"

void makeSpriteQuad(Vector2 position, Vector2 size, Vector4 color,
                    SpriteVertex* vertices, uint16* indices)
{
    const Vector2 corners[SPRITE_QUAD_VERTEX_COUNT] =
    {
        Vector2(0.0f, 0.0f),
        Vector2(0.0f, 1.0f),
        Vector2(1.0f, 1.0f),
        Vector2(1.0f, 0.0f)
    };

    for(int i=0; i<SPRITE_QUAD_VERTEX_COUNT; i++)
    {
        vertices[i].position = position + corners[i]*size;
        vertices[i].texCoord = corners[i];
        vertices[i].color = color;
    }

    const uint16 quadIndices[SPRITE_QUAD_INDEX_COUNT] = {0, 1, 2, 0, 2, 3};
    for(int i=0; i<SPRITE_QUAD_INDEX_COUNT; i++)
    {
        indices[i] = quadIndices[i];
    }
}

Vector2 centeredSpritePosition(Vector2 size, int viewportWidth, int viewportHeight)
{
    return Vector2((viewportWidth - size.x)*0.5f, (viewportHeight - size.y)*0.5f);
}

VertexInput vertexInputFromSpriteVertex(const SpriteVertex& vertex)
{
    VertexInput result;
    result.position = vertex.position;
    result.texCoord = vertex.texCoord;
    result.color = vertex.color;
    return result;
}
