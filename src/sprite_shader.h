#ifndef _SPRITE_SHADER_H
#define _SPRITE_SHADER_H

#include "shader_source.h"
#include "texture.h"
#include "vecmath.h"

// CPU reference implementation of the two stages produced by buildVertexShaderSource
// and buildFragmentShaderSource. Given the same inputs these return what the GPU outputs,
// up to floating-point rounding.
//
// Nothing here validates its inputs. A zero or negative resolution produces inf/NaN
// positions, and colours are never clamped, exactly as on the GPU.

// Per-vertex attributes. color is ignored by variants without a colour attribute.
struct VertexInput
{
    Vector2 position; // Pixel space, origin top-left, Y down
    Vector2 texCoord;
    Vector4 color;
};

// Constant for a whole draw
struct Uniforms
{
    Vector2 resolution;
    int constTriangle; // > 0 selects the fixed triangle, if the variant declares it
};

// What the vertex stage hands to the rasterizer
struct VertexOutput
{
    Vector4 clipPosition;
    Vector4 color;
    Vector2 texCoord;
};

namespace SpriteShader
{
    const int CONSTANT_TRIANGLE_VERTEX_COUNT = 3;

    // Points in normalized [0,1] space used when the constant-triangle toggle is set
    extern const Vector2 CONSTANT_TRIANGLE[CONSTANT_TRIANGLE_VERTEX_COUNT];

    // Pixel (0,0) maps to the top-left of clip space and pixel (resolution) to the bottom-right
    Vector4 pixelToClip(Vector2 position, Vector2 resolution);

    // vertexIndex must be 0, 1 or 2. Other values are undefined on the GPU,
    // here they are asserted against and wrapped into the table.
    Vector4 constantTriangleToClip(int vertexIndex);

    VertexOutput runVertexStage(const ShaderVariant& variant, const VertexInput& input,
                                const Uniforms& uniforms, int vertexIndex);

    // Weights are barycentric and expected to sum to 1
    VertexOutput interpolateVaryings(const VertexOutput& a, const VertexOutput& b,
                                     const VertexOutput& c,
                                     float weightA, float weightB, float weightC);

    // Component-wise tint, no clamping
    Vector4 shadeFragment(Vector4 color, Vector4 texel);

    Vector4 runFragmentStage(const VertexOutput& varyings, const Texture& albedo);
}

#endif
