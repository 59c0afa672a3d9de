#ifndef _SHADER_SOURCE_H
#define _SHADER_SOURCE_H

#include <string>

// How the host associates attributes and uniforms with their slots in the program.
// Implicit: locations are looked up by name after linking.
// Explicit: locations are fixed in the GLSL with layout qualifiers, so host binding
//           code must use the constants in ShaderBinding below.
enum BindingStrategy
{
    BINDING_IMPLICIT,
    BINDING_EXPLICIT
};

struct ShaderVariant
{
    BindingStrategy binding;

    // When false the colour varying is constant opaque white
    bool hasVertexColor;

    // When true the u_constTriangle toggle is declared and honoured
    bool hasConstantTriangle;
};

// Name-bound, no per-vertex colour, supports the fixed debug triangle
extern const ShaderVariant BASIC_VARIANT;

// Explicit locations with a per-vertex colour attribute
extern const ShaderVariant SPRITE_VARIANT;

namespace ShaderBinding
{
    const int POSITION_LOCATION = 0;
    const int TEXCOORD_LOCATION = 1;
    const int COLOR_LOCATION = 2;

    // Uniform locations are per-program, the vertex and fragment stages use distinct slots
    const int RESOLUTION_LOCATION = 0;
    const int ALBEDO_LOCATION = 1;
    const int CONST_TRIANGLE_LOCATION = 2;

    const int ALBEDO_TEXTURE_UNIT = 0;

    const char* const POSITION_NAME = "a_position";
    const char* const TEXCOORD_NAME = "a_texCoord";
    const char* const COLOR_NAME = "a_color";
    const char* const RESOLUTION_NAME = "u_resolution";
    const char* const CONST_TRIANGLE_NAME = "u_constTriangle";
    const char* const ALBEDO_NAME = "u_albedo";
}

const char* bindingStrategyName(BindingStrategy binding);

// Returns the GL extension the variant's source requires, or nullptr if core GL 3.3 is enough
const char* requiredExtension(const ShaderVariant& variant);

std::string buildVertexShaderSource(const ShaderVariant& variant);
std::string buildFragmentShaderSource(const ShaderVariant& variant);

#endif
