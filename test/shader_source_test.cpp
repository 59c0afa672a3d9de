#include <string>

#include "catch.hpp"

#include "shader_source.h"

static bool contains(const std::string& haystack, const char* needle)
{
    return haystack.find(needle) != std::string::npos;
}

TEST_CASE("The presets describe the two binding conventions")
{
    REQUIRE(BASIC_VARIANT.binding == BINDING_IMPLICIT);
    REQUIRE_FALSE(BASIC_VARIANT.hasVertexColor);
    REQUIRE(BASIC_VARIANT.hasConstantTriangle);

    REQUIRE(SPRITE_VARIANT.binding == BINDING_EXPLICIT);
    REQUIRE(SPRITE_VARIANT.hasVertexColor);
    REQUIRE_FALSE(SPRITE_VARIANT.hasConstantTriangle);
}

TEST_CASE("Only explicit binding needs the uniform location extension")
{
    REQUIRE(requiredExtension(BASIC_VARIANT) == nullptr);
    REQUIRE(std::string(requiredExtension(SPRITE_VARIANT)) == "GL_ARB_explicit_uniform_location");
}

TEST_CASE("Explicit vertex sources pin every input to its fixed location")
{
    std::string src = buildVertexShaderSource(SPRITE_VARIANT);

    REQUIRE(src.compare(0, 17, "#version 330 core") == 0);
    REQUIRE(contains(src, "#extension GL_ARB_explicit_uniform_location : require"));
    REQUIRE(contains(src, "layout (location = 0) in vec2 a_position;"));
    REQUIRE(contains(src, "layout (location = 1) in vec2 a_texCoord;"));
    REQUIRE(contains(src, "layout (location = 2) in vec4 a_color;"));
    REQUIRE(contains(src, "layout (location = 0) uniform vec2 u_resolution;"));
    REQUIRE(contains(src, "v_color = a_color;"));
    REQUIRE_FALSE(contains(src, "u_constTriangle"));
}

TEST_CASE("Implicit vertex sources declare inputs by name only")
{
    std::string src = buildVertexShaderSource(BASIC_VARIANT);

    REQUIRE_FALSE(contains(src, "layout"));
    REQUIRE_FALSE(contains(src, "#extension"));
    REQUIRE(contains(src, "in vec2 a_position;"));
    REQUIRE(contains(src, "in vec2 a_texCoord;"));
    REQUIRE_FALSE(contains(src, "a_color"));
    REQUIRE(contains(src, "uniform vec2 u_resolution;"));
    REQUIRE(contains(src, "uniform int u_constTriangle;"));
    REQUIRE(contains(src, "v_color = vec4(1.0, 1.0, 1.0, 1.0);"));
}

TEST_CASE("The constant triangle path indexes the fixed table by vertex id")
{
    std::string src = buildVertexShaderSource(BASIC_VARIANT);

    REQUIRE(contains(src, "vec2(0.5, 1.0)"));
    REQUIRE(contains(src, "if(u_constTriangle > 0)"));
    REQUIRE(contains(src, "CONST_TRIANGLE[gl_VertexID] - 0.5"));
}

TEST_CASE("Every vertex variant uses the same pixel to clip transform")
{
    ShaderVariant explicitWithTriangle = {BINDING_EXPLICIT, true, true};
    const ShaderVariant variants[] = {BASIC_VARIANT, SPRITE_VARIANT, explicitWithTriangle};

    for(const ShaderVariant& variant : variants)
    {
        std::string src = buildVertexShaderSource(variant);
        REQUIRE(contains(src, "vec2 normalized = a_position / u_resolution;"));
        REQUIRE(contains(src, "gl_Position = vec4(clipSpace.x, -clipSpace.y, 0.0, 1.0);"));
        REQUIRE(contains(src, "v_texCoord = a_texCoord;"));
    }
}

TEST_CASE("An explicit variant with the toggle gives it a fixed location")
{
    ShaderVariant variant = {BINDING_EXPLICIT, true, true};
    std::string src = buildVertexShaderSource(variant);

    REQUIRE(contains(src, "layout (location = 2) uniform int u_constTriangle;"));
}

TEST_CASE("Fragment sources multiply the colour by the albedo sample")
{
    std::string explicitSrc = buildFragmentShaderSource(SPRITE_VARIANT);
    std::string implicitSrc = buildFragmentShaderSource(BASIC_VARIANT);

    REQUIRE(contains(explicitSrc, "layout (location = 1) uniform sampler2D u_albedo;"));
    REQUIRE(contains(implicitSrc, "uniform sampler2D u_albedo;"));
    REQUIRE_FALSE(contains(implicitSrc, "layout"));

    REQUIRE(contains(explicitSrc, "outColor = v_color * texture(u_albedo, v_texCoord);"));
    REQUIRE(contains(implicitSrc, "outColor = v_color * texture(u_albedo, v_texCoord);"));
}

TEST_CASE("Binding strategies have printable names")
{
    REQUIRE(std::string(bindingStrategyName(BINDING_IMPLICIT)) == "implicit");
    REQUIRE(std::string(bindingStrategyName(BINDING_EXPLICIT)) == "explicit");
}
