#include <string.h>

#include <string>
#include <unordered_set>

#include <GL/gl3w.h>

#include "graphicsutil.h"
#include "logging.h"
#include "render.h"

int screenWidth;
int screenHeight;

static std::unordered_set<std::string> extensions;

static GLenum glWrapMode(TextureWrapMode mode)
{
    switch(mode)
    {
    case WRAP_CLAMP_TO_EDGE:
        return GL_CLAMP_TO_EDGE;
    case WRAP_REPEAT:
        return GL_REPEAT;
    case WRAP_MIRRORED_REPEAT:
        return GL_MIRRORED_REPEAT;
    }
    return GL_CLAMP_TO_EDGE;
}

static void enableFloatAttribute(GLint location, GLint componentCount, size_t offset)
{
    if(location < 0)
    {
        return;
    }
    glEnableVertexAttribArray((GLuint)location);
    glVertexAttribPointer((GLuint)location, componentCount, GL_FLOAT, GL_FALSE,
                          (GLsizei)SPRITE_VERTEX_STRIDE, (const void*)offset);
}

// Sets the uniforms that are constant for a draw and binds the albedo texture
static void beginDraw(const SpriteProgram& program, const SpriteMesh& mesh, GLuint texture)
{
    glViewport(0, 0, screenWidth, screenHeight);
    glUseProgram(program.program);

    glUniform2f(program.resolutionLocation, (float)screenWidth, (float)screenHeight);
    glUniform1i(program.albedoLocation, ShaderBinding::ALBEDO_TEXTURE_UNIT);

    glActiveTexture(GL_TEXTURE0 + ShaderBinding::ALBEDO_TEXTURE_UNIT);
    glBindTexture(GL_TEXTURE_2D, texture);
    glBindVertexArray(mesh.vertexArray);
}

static void endDraw()
{
    glBindVertexArray(0);
    glBindTexture(GL_TEXTURE_2D, 0);
    glUseProgram(0);
}

bool Render::Setup()
{
    if(gl3wInit())
    {
        logFail("Unable to initialize OpenGL\n");
        return false;
    }
    if(!gl3wIsSupported(3, 3))
    {
        logFail("OpenGL 3.3 is not supported by this context\n");
        return false;
    }

    logInfo("Initialized OpenGL %s with support for GLSL %s\n",
            glGetString(GL_VERSION), glGetString(GL_SHADING_LANGUAGE_VERSION));
    logInfo("OpenGL vendor: %s, renderer: %s\n",
            glGetString(GL_VENDOR), glGetString(GL_RENDERER));

    GLint extensionCount = 0;
    glGetIntegerv(GL_NUM_EXTENSIONS, &extensionCount);
    for(GLint i=0; i<extensionCount; i++)
    {
        const char* name = (const char*)glGetStringi(GL_EXTENSIONS, (GLuint)i);
        if(name)
        {
            extensions.insert(name);
        }
    }
    logTerm("Found %d OpenGL extensions\n", (int)extensionCount);

    // makeSpriteQuad winds both triangles counter-clockwise once Y is flipped
    glFrontFace(GL_CCW);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    return true;
}

void Render::Shutdown()
{
    logInfo("Deinitialize graphics subsystem\n");
    extensions.clear();
}

void Render::updateWindowSize(int newWidth, int newHeight)
{
    screenWidth = newWidth;
    screenHeight = newHeight;
    glViewport(0,0, newWidth, newHeight);
}

bool Render::hasExtension(const char* name)
{
    return extensions.find(name) != extensions.end();
}

bool Render::chooseVariant(BindingChoice choice, ShaderVariant* variant)
{
    bool explicitSupported = hasExtension(requiredExtension(SPRITE_VARIANT));
    switch(choice)
    {
    case BINDING_CHOICE_IMPLICIT:
        *variant = BASIC_VARIANT;
        break;
    case BINDING_CHOICE_EXPLICIT:
        if(!explicitSupported)
        {
            logFail("Explicit binding requested but %s is not available\n",
                    requiredExtension(SPRITE_VARIANT));
            return false;
        }
        *variant = SPRITE_VARIANT;
        break;
    case BINDING_CHOICE_AUTO:
        *variant = explicitSupported ? SPRITE_VARIANT : BASIC_VARIANT;
        break;
    }

    logInfo("Using %s shader binding\n", bindingStrategyName(variant->binding));
    return true;
}

bool Render::createSpriteProgram(const ShaderVariant& variant, SpriteProgram* result)
{
    using namespace ShaderBinding;

    std::string vertexSource = buildVertexShaderSource(variant);
    std::string fragmentSource = buildFragmentShaderSource(variant);
    GLuint program = loadShaderProgramFromString(vertexSource.c_str(), fragmentSource.c_str());
    if(program == 0)
    {
        return false;
    }

    result->program = program;
    result->variant = variant;
    if(variant.binding == BINDING_EXPLICIT)
    {
        result->positionLocation = POSITION_LOCATION;
        result->texCoordLocation = TEXCOORD_LOCATION;
        result->colorLocation = variant.hasVertexColor ? COLOR_LOCATION : -1;
        result->resolutionLocation = RESOLUTION_LOCATION;
        result->constTriangleLocation = variant.hasConstantTriangle ? CONST_TRIANGLE_LOCATION : -1;
        result->albedoLocation = ALBEDO_LOCATION;
    }
    else
    {
        // The linker may drop unused inputs, in which case these come back as -1
        result->positionLocation = glGetAttribLocation(program, POSITION_NAME);
        result->texCoordLocation = glGetAttribLocation(program, TEXCOORD_NAME);
        result->colorLocation = variant.hasVertexColor ? glGetAttribLocation(program, COLOR_NAME) : -1;
        result->resolutionLocation = glGetUniformLocation(program, RESOLUTION_NAME);
        result->constTriangleLocation = variant.hasConstantTriangle ?
            glGetUniformLocation(program, CONST_TRIANGLE_NAME) : -1;
        result->albedoLocation = glGetUniformLocation(program, ALBEDO_NAME);
    }

    logInfo("Created sprite program %u (position=%d texCoord=%d color=%d resolution=%d constTriangle=%d albedo=%d)\n",
            program, result->positionLocation, result->texCoordLocation, result->colorLocation,
            result->resolutionLocation, result->constTriangleLocation, result->albedoLocation);
    return true;
}

void Render::destroySpriteProgram(SpriteProgram* program)
{
    if(program->program != 0)
    {
        glDeleteProgram(program->program);
        program->program = 0;
    }
}

GLuint Render::createTexture(const Texture& texture)
{
    if(texture.data() == nullptr)
    {
        logWarn("Cannot upload a texture without storage\n");
        return 0;
    }

    GLint previousTexture = 0;
    glGetIntegerv(GL_TEXTURE_BINDING_2D, &previousTexture);

    GLuint result;
    glGenTextures(1, &result);
    glBindTexture(GL_TEXTURE_2D, result);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, glWrapMode(texture.wrapS()));
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, glWrapMode(texture.wrapT()));
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_BASE_LEVEL, 0);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAX_LEVEL, 0);

    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8,
                 texture.width(), texture.height(), 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, texture.data());

    GLenum error = glGetError();
    glBindTexture(GL_TEXTURE_2D, (GLuint)previousTexture);
    if(error != GL_NO_ERROR)
    {
        logWarn("Texture upload failed: %s\n", glErrorString(error));
        glDeleteTextures(1, &result);
        return 0;
    }
    return result;
}

void Render::destroyTexture(GLuint texture)
{
    if(texture != 0)
    {
        glDeleteTextures(1, &texture);
    }
}

bool Render::createSpriteMesh(const SpriteProgram& program,
                              const SpriteVertex* vertices, int vertexCount,
                              const uint16* indices, int indexCount,
                              SpriteMesh* result)
{
    memset(result, 0, sizeof(SpriteMesh));

    glGenVertexArrays(1, &result->vertexArray);
    glBindVertexArray(result->vertexArray);

    glGenBuffers(1, &result->vertexBuffer);
    glBindBuffer(GL_ARRAY_BUFFER, result->vertexBuffer);
    glBufferData(GL_ARRAY_BUFFER, vertexCount*SPRITE_VERTEX_STRIDE, vertices, GL_DYNAMIC_DRAW);

    enableFloatAttribute(program.positionLocation, 2, SPRITE_VERTEX_POSITION_OFFSET);
    enableFloatAttribute(program.texCoordLocation, 2, SPRITE_VERTEX_TEXCOORD_OFFSET);
    enableFloatAttribute(program.colorLocation, 4, SPRITE_VERTEX_COLOR_OFFSET);

    glGenBuffers(1, &result->indexBuffer);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, result->indexBuffer);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, indexCount*sizeof(uint16), indices, GL_STATIC_DRAW);
    result->indexCount = indexCount;
    result->vertexCount = vertexCount;

    // Unbind the vertex array first so it keeps its element buffer binding
    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, 0);

    GLenum error = glGetError();
    if(error != GL_NO_ERROR)
    {
        logFail("Failed to create sprite mesh: %s\n", glErrorString(error));
        destroySpriteMesh(result);
        return false;
    }
    return true;
}

bool Render::updateSpriteMesh(const SpriteMesh& mesh, const SpriteVertex* vertices, int vertexCount)
{
    if(vertexCount > mesh.vertexCount)
    {
        logFail("Cannot update %d vertices of a mesh created with %d\n",
                vertexCount, (int)mesh.vertexCount);
        return false;
    }

    glBindBuffer(GL_ARRAY_BUFFER, mesh.vertexBuffer);
    glBufferSubData(GL_ARRAY_BUFFER, 0, vertexCount*SPRITE_VERTEX_STRIDE, vertices);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    GLenum error = glGetError();
    if(error != GL_NO_ERROR)
    {
        logFail("Failed to update sprite mesh: %s\n", glErrorString(error));
        return false;
    }
    return true;
}

void Render::destroySpriteMesh(SpriteMesh* mesh)
{
    if(mesh->indexBuffer != 0)
    {
        glDeleteBuffers(1, &mesh->indexBuffer);
    }
    if(mesh->vertexBuffer != 0)
    {
        glDeleteBuffers(1, &mesh->vertexBuffer);
    }
    if(mesh->vertexArray != 0)
    {
        glDeleteVertexArrays(1, &mesh->vertexArray);
    }
    memset(mesh, 0, sizeof(SpriteMesh));
}

void Render::drawSpriteMesh(const SpriteProgram& program, const SpriteMesh& mesh, GLuint texture)
{
    beginDraw(program, mesh, texture);
    if(program.constTriangleLocation >= 0)
    {
        glUniform1i(program.constTriangleLocation, 0);
    }
    glDrawElements(GL_TRIANGLES, mesh.indexCount, GL_UNSIGNED_SHORT, 0);
    endDraw();
}

bool Render::drawConstantTriangle(const SpriteProgram& program, const SpriteMesh& mesh, GLuint texture)
{
    if(program.constTriangleLocation < 0)
    {
        logWarn("The %s shader variant has no constant triangle\n",
                bindingStrategyName(program.variant.binding));
        return false;
    }

    beginDraw(program, mesh, texture);
    glUniform1i(program.constTriangleLocation, 1);
    glDrawArrays(GL_TRIANGLES, 0, SpriteShader::CONSTANT_TRIANGLE_VERTEX_COUNT);
    endDraw();
    return true;
}

void Render::glPrintError(bool alwaysPrint)
{
    GLenum error = glGetError();
    if(error == GL_NO_ERROR)
    {
        if(alwaysPrint)
        {
            logInfo("OpenGL error: GL_NO_ERROR\n");
        }
        return;
    }

    logWarn("OpenGL error: %s\n", glErrorString(error));
}
