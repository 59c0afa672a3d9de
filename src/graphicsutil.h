#ifndef _GRAPHICSUTIL_H
#define _GRAPHICSUTIL_H

#include <GL/gl3w.h>

const char* glErrorString(GLenum error);

// Both return 0 after logging the driver's info log if compilation or linking fails.
// Failures here are fatal for the program in question, nothing should be drawn with it.
GLuint loadShaderFromString(const char* shaderStr, GLenum shaderType);
GLuint loadShaderProgramFromString(const char* vertShaderStr, const char* fragShaderStr);

#endif
