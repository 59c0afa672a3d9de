#ifndef _RENDER_H
#define _RENDER_H

#include <GL/gl3w.h>

#include "common.h"
#include "config.h"
#include "shader_source.h"
#include "sprite_vertex.h"
#include "texture.h"

extern int screenWidth;
extern int screenHeight;

// A linked program for one shader variant, with the slots the host writes to.
// Locations are -1 where the variant does not declare the input.
struct SpriteProgram
{
    GLuint program;
    ShaderVariant variant;

    GLint positionLocation;
    GLint texCoordLocation;
    GLint colorLocation;

    GLint resolutionLocation;
    GLint constTriangleLocation;
    GLint albedoLocation;
};

struct SpriteMesh
{
    GLuint vertexArray;
    GLuint vertexBuffer;
    GLuint indexBuffer;
    GLsizei vertexCount;
    GLsizei indexCount;
};

// All of these require a current OpenGL 3.3 core context on the calling thread
namespace Render
{
    bool Setup();
    void Shutdown();

    void updateWindowSize(int newWidth, int newHeight);

    bool hasExtension(const char* name);

    // Fails if explicit binding is requested but the driver lacks the extension for it
    bool chooseVariant(BindingChoice choice, ShaderVariant* variant);

    bool createSpriteProgram(const ShaderVariant& variant, SpriteProgram* result);
    void destroySpriteProgram(SpriteProgram* program);

    // Returns 0 if the texture has no storage
    GLuint createTexture(const Texture& texture);
    void destroyTexture(GLuint texture);

    bool createSpriteMesh(const SpriteProgram& program,
                          const SpriteVertex* vertices, int vertexCount,
                          const uint16* indices, int indexCount,
                          SpriteMesh* result);
    // Overwrites the first vertexCount vertices, the index buffer is left as it was
    bool updateSpriteMesh(const SpriteMesh& mesh, const SpriteVertex* vertices, int vertexCount);
    void destroySpriteMesh(SpriteMesh* mesh);

    void drawSpriteMesh(const SpriteProgram& program, const SpriteMesh& mesh, GLuint texture);

    // The mesh only provides a bound vertex array, its buffers are not read
    bool drawConstantTriangle(const SpriteProgram& program, const SpriteMesh& mesh, GLuint texture);

    void glPrintError(bool alwaysPrint);
}

#endif
