// NOTE: The sources are assembled in code rather than loaded from external files so that the
//       GLSL and the host-side binding constants in shader_source.h can never drift apart, and
//       so the working directory is irrelevant when running the demo.

#include <stdio.h>

#include "shader_source.h"

const ShaderVariant BASIC_VARIANT = {BINDING_IMPLICIT, false, true};
const ShaderVariant SPRITE_VARIANT = {BINDING_EXPLICIT, true, false};

static const char* EXPLICIT_UNIFORM_EXTENSION = "GL_ARB_explicit_uniform_location";

// Shared by every variant, a_position and u_resolution are always declared
static const char* pixelToClipSnippet =
    "    vec2 normalized = a_position / u_resolution;\n"
    "    vec2 scaled = normalized * 2.0;\n"
    "    vec2 clipSpace = scaled - 1.0;\n"
    "    gl_Position = vec4(clipSpace.x, -clipSpace.y, 0.0, 1.0);\n";

static const char* constTriangleTable =
    "const vec2 CONST_TRIANGLE[3] = vec2[3](\n"
    "    vec2(0.5, 1.0),\n"
    "    vec2(0.0, 0.0),\n"
    "    vec2(1.0, 0.0)\n"
    ");\n";

// Produces either "layout (location = N) " or nothing, depending on the binding strategy
static std::string layoutQualifier(BindingStrategy binding, int location)
{
    if(binding != BINDING_EXPLICIT)
    {
        return std::string();
    }

    char buffer[32];
    snprintf(buffer, sizeof(buffer), "layout (location = %d) ", location);
    return std::string(buffer);
}

static std::string versionHeader(const ShaderVariant& variant)
{
    std::string result = "#version 330 core\n";
    const char* extension = requiredExtension(variant);
    if(extension)
    {
        result += "#extension ";
        result += extension;
        result += " : require\n";
    }
    result += "\n";
    return result;
}

const char* bindingStrategyName(BindingStrategy binding)
{
    switch(binding)
    {
    case BINDING_IMPLICIT:
        return "implicit";
    case BINDING_EXPLICIT:
        return "explicit";
    }
    return "unknown";
}

const char* requiredExtension(const ShaderVariant& variant)
{
    // Attribute locations are core in 3.3, uniform locations are not
    if(variant.binding == BINDING_EXPLICIT)
    {
        return EXPLICIT_UNIFORM_EXTENSION;
    }
    return nullptr;
}

std::string buildVertexShaderSource(const ShaderVariant& variant)
{
    using namespace ShaderBinding;
    BindingStrategy binding = variant.binding;

    std::string src = versionHeader(variant);

    src += layoutQualifier(binding, POSITION_LOCATION) + "in vec2 " + POSITION_NAME + ";\n";
    src += layoutQualifier(binding, TEXCOORD_LOCATION) + "in vec2 " + TEXCOORD_NAME + ";\n";
    if(variant.hasVertexColor)
    {
        src += layoutQualifier(binding, COLOR_LOCATION) + "in vec4 " + COLOR_NAME + ";\n";
    }
    src += "\n";

    src += layoutQualifier(binding, RESOLUTION_LOCATION) + "uniform vec2 " + RESOLUTION_NAME + ";\n";
    if(variant.hasConstantTriangle)
    {
        src += layoutQualifier(binding, CONST_TRIANGLE_LOCATION) +
               "uniform int " + CONST_TRIANGLE_NAME + ";\n";
    }
    src += "\n";

    src += "out vec4 v_color;\n";
    src += "out vec2 v_texCoord;\n";
    src += "\n";

    if(variant.hasConstantTriangle)
    {
        src += constTriangleTable;
        src += "\n";
    }

    src += "void main()\n";
    src += "{\n";
    if(variant.hasConstantTriangle)
    {
        src += std::string("    if(") + CONST_TRIANGLE_NAME + " > 0)\n";
        src += "    {\n";
        src += "        gl_Position = vec4(CONST_TRIANGLE[gl_VertexID] - 0.5, 0.0, 1.0);\n";
        src += "    }\n";
        src += "    else\n";
        src += "    {\n";
        src += pixelToClipSnippet;
        src += "    }\n";
    }
    else
    {
        src += pixelToClipSnippet;
    }

    if(variant.hasVertexColor)
    {
        src += std::string("    v_color = ") + COLOR_NAME + ";\n";
    }
    else
    {
        src += "    v_color = vec4(1.0, 1.0, 1.0, 1.0);\n";
    }
    src += std::string("    v_texCoord = ") + TEXCOORD_NAME + ";\n";
    src += "}\n";

    return src;
}

std::string buildFragmentShaderSource(const ShaderVariant& variant)
{
    using namespace ShaderBinding;

    std::string src = versionHeader(variant);

    src += "in vec4 v_color;\n";
    src += "in vec2 v_texCoord;\n";
    src += "\n";
    src += layoutQualifier(variant.binding, ALBEDO_LOCATION) +
           "uniform sampler2D " + ALBEDO_NAME + ";\n";
    src += "\n";
    src += "out vec4 outColor;\n";
    src += "\n";
    src += "void main()\n";
    src += "{\n";
    src += std::string("    outColor = v_color * texture(") + ALBEDO_NAME + ", v_texCoord);\n";
    src += "}\n";

    return src;
}
