#include "graphicsutil.h"

#include <GL/gl3w.h>

#include "common.h"
#include "logging.h"

static const int INFO_LOG_LENGTH = 1024;

const char* glErrorString(GLenum error)
{
    switch(error)
    {
    case GL_NO_ERROR:
        return "GL_NO_ERROR";
    case GL_INVALID_ENUM:
        return "GL_INVALID_ENUM";
    case GL_INVALID_VALUE:
        return "GL_INVALID_VALUE";
    case GL_INVALID_OPERATION:
        return "GL_INVALID_OPERATION";
    case GL_INVALID_FRAMEBUFFER_OPERATION:
        return "GL_INVALID_FRAMEBUFFER_OPERATION";
    case GL_OUT_OF_MEMORY:
        return "GL_OUT_OF_MEMORY";
    default:
        return "UNRECOGNIZED";
    }
}

static const char* shaderTypeName(GLenum shaderType)
{
    if(shaderType == GL_VERTEX_SHADER)
        return "vertex";
    if(shaderType == GL_FRAGMENT_SHADER)
        return "fragment";
    return "unknown";
}

GLuint loadShaderFromString(const char* shaderStr, GLenum shaderType)
{
    GLuint shader = glCreateShader(shaderType);
    if(shader == 0)
    {
        logFail("Unable to create %s shader object\n", shaderTypeName(shaderType));
        return 0;
    }
    glShaderSource(shader, 1, &shaderStr, NULL);
    glCompileShader(shader);

    GLint compileStatus;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &compileStatus);
    if(compileStatus != GL_TRUE)
    {
        GLsizei logLength = 0;
        GLchar message[INFO_LOG_LENGTH];
        glGetShaderInfoLog(shader, INFO_LOG_LENGTH, &logLength, message);
        logFail("Failed to compile %s shader: %s\n", shaderTypeName(shaderType), message);

        glDeleteShader(shader);
        return 0;
    }

    return shader;
}

GLuint loadShaderProgramFromString(const char* vertShaderStr,
                                   const char* fragShaderStr)
{
    GLuint vertShader = loadShaderFromString(vertShaderStr, GL_VERTEX_SHADER);
    if(vertShader == 0)
    {
        return 0;
    }
    GLuint fragShader = loadShaderFromString(fragShaderStr, GL_FRAGMENT_SHADER);
    if(fragShader == 0)
    {
        glDeleteShader(vertShader);
        return 0;
    }

    GLuint program = glCreateProgram();
    glAttachShader(program, vertShader);
    glAttachShader(program, fragShader);
    glLinkProgram(program);

    // Once linked the shader objects are no longer needed
    glDetachShader(program, vertShader);
    glDetachShader(program, fragShader);
    glDeleteShader(vertShader);
    glDeleteShader(fragShader);

    GLint linkStatus;
    glGetProgramiv(program, GL_LINK_STATUS, &linkStatus);
    if(linkStatus != GL_TRUE)
    {
        GLsizei logLength = 0;
        GLchar message[INFO_LOG_LENGTH];
        glGetProgramInfoLog(program, INFO_LOG_LENGTH, &logLength, message);
        logFail("Failed to link shader program: %s\n", message);

        glDeleteProgram(program);
        return 0;
    }

    return program;
}
