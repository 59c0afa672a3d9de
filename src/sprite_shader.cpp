#include <assert.h>

#include "sprite_shader.h"

const Vector2 SpriteShader::CONSTANT_TRIANGLE[SpriteShader::CONSTANT_TRIANGLE_VERTEX_COUNT] =
{
    Vector2(0.5f, 1.0f),
    Vector2(0.0f, 0.0f),
    Vector2(1.0f, 0.0f)
};

static const Vector4 OPAQUE_WHITE(1.0f, 1.0f, 1.0f, 1.0f);

Vector4 SpriteShader::pixelToClip(Vector2 position, Vector2 resolution)
{
    Vector2 normalized = position / resolution;
    Vector2 scaled = normalized * 2.0f;
    Vector2 clipSpace = scaled - 1.0f;

    // Pixel rows grow downwards, clip space grows upwards
    return Vector4(clipSpace.x, -clipSpace.y, 0.0f, 1.0f);
}

Vector4 SpriteShader::constantTriangleToClip(int vertexIndex)
{
    assert((vertexIndex >= 0) && (vertexIndex < CONSTANT_TRIANGLE_VERTEX_COUNT));
    int index = vertexIndex % CONSTANT_TRIANGLE_VERTEX_COUNT;
    if(index < 0)
    {
        index += CONSTANT_TRIANGLE_VERTEX_COUNT;
    }

    // NOTE: No resolution division and no Y flip on this path
    Vector2 point = CONSTANT_TRIANGLE[index] - 0.5f;
    return Vector4(point.x, point.y, 0.0f, 1.0f);
}

VertexOutput SpriteShader::runVertexStage(const ShaderVariant& variant, const VertexInput& input,
                                          const Uniforms& uniforms, int vertexIndex)
{
    VertexOutput result;
    if(variant.hasConstantTriangle && (uniforms.constTriangle > 0))
    {
        result.clipPosition = constantTriangleToClip(vertexIndex);
    }
    else
    {
        result.clipPosition = pixelToClip(input.position, uniforms.resolution);
    }

    result.color = variant.hasVertexColor ? input.color : OPAQUE_WHITE;
    result.texCoord = input.texCoord;
    return result;
}

VertexOutput SpriteShader::interpolateVaryings(const VertexOutput& a, const VertexOutput& b,
                                               const VertexOutput& c,
                                               float weightA, float weightB, float weightC)
{
    VertexOutput result;
    result.clipPosition = a.clipPosition*weightA + b.clipPosition*weightB + c.clipPosition*weightC;
    result.color = a.color*weightA + b.color*weightB + c.color*weightC;
    result.texCoord = a.texCoord*weightA + b.texCoord*weightB + c.texCoord*weightC;
    return result;
}

Vector4 SpriteShader::shadeFragment(Vector4 color, Vector4 texel)
{
    return color * texel;
}

Vector4 SpriteShader::runFragmentStage(const VertexOutput& varyings, const Texture& albedo)
{
    Vector4 texel = albedo.sample(varyings.texCoord);
    return shadeFragment(varyings.color, texel);
}
