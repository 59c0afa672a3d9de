#include <GL/gl3w.h>
#include <GLFW/glfw3.h>

#include "common.h"
#include "config.h"
#include "frame_counter.h"
#include "logging.h"
#include "platform.h"
#include "render.h"
#include "sprite_vertex.h"
#include "texture.h"

#ifndef BUILD_VERSION
#define BUILD_VERSION "Unknown"
#endif

const int CHECKER_TEXTURE_SIZE = 8;
const float SPRITE_SIZE = 256.0f;
const double FPS_LOG_INTERVAL = 1.0;

struct DemoState
{
    bool isRunning;
};

static void glfwErrorCallback(int errorCode, const char* description)
{
    logWarn("GLFW Error %d: %s\n", errorCode, description);
}

static void windowResizeCallback(GLFWwindow* window, int newWidth, int newHeight)
{
    Render::updateWindowSize(newWidth, newHeight);
}

static void windowCloseRequestCallback(GLFWwindow* window)
{
    DemoState* state = (DemoState*)glfwGetWindowUserPointer(window);
    state->isRunning = false;
}

static void keyEventCallback(GLFWwindow* window, int key, int scancode, int action, int mods)
{
    if((action == GLFW_PRESS) && (key == GLFW_KEY_ESCAPE))
    {
        DemoState* state = (DemoState*)glfwGetWindowUserPointer(window);
        state->isRunning = false;
    }
}

// Two-tone checkerboard with a translucent border so wrap modes are easy to tell apart
static bool buildCheckerTexture(TextureWrapMode wrapMode, Texture* texture)
{
    TextureError error = texture->create(CHECKER_TEXTURE_SIZE, CHECKER_TEXTURE_SIZE);
    if(error != TEXTURE_OK)
    {
        logFail("Unable to create albedo texture: %s\n", textureErrorString(error));
        return false;
    }

    for(int y=0; y<CHECKER_TEXTURE_SIZE; y++)
    {
        for(int x=0; x<CHECKER_TEXTURE_SIZE; x++)
        {
            bool border = (x == 0) || (y == 0);
            bool light = ((x + y) % 2) == 0;
            uint8 shade = light ? 230 : 60;
            uint8 alpha = border ? 128 : 255;
            texture->setPixel(x, y, shade, light ? shade : 120, 200, alpha);
        }
    }
    texture->setWrapMode(wrapMode, wrapMode);
    return true;
}

// Centres the sprite in the current framebuffer, so call again after a resize
static void buildSpriteVertices(const DemoConfig& config, SpriteVertex* vertices, uint16* indices)
{
    Vector2 size(SPRITE_SIZE, SPRITE_SIZE);
    Vector2 position = centeredSpritePosition(size, screenWidth, screenHeight);
    makeSpriteQuad(position, size, config.tint, vertices, indices);

    // Stretch the UVs past [0,1] so the configured wrap mode is visible
    if(config.wrapMode != WRAP_CLAMP_TO_EDGE)
    {
        for(int i=0; i<SPRITE_QUAD_VERTEX_COUNT; i++)
        {
            vertices[i].texCoord = vertices[i].texCoord*2.0f - 0.5f;
        }
    }
}

static int runDemo(const DemoConfig& config)
{
    DemoState state = {};
    state.isRunning = true;

    logInfo("Initializing GLFW version %s\n", glfwGetVersionString());
    glfwSetErrorCallback(glfwErrorCallback);
    if(!glfwInit())
    {
        logFail("Error when trying to initialize GLFW\n");
        return 1;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_API);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);

    GLFWwindow* window = glfwCreateWindow(config.windowWidth, config.windowHeight,
                                          "Sprite Shader Demo", 0, 0);
    if(!window)
    {
        logFail("Error when trying to create GLFW Window\n");
        glfwTerminate();
        return 1;
    }
    glfwSetWindowUserPointer(window, &state);
    glfwSetFramebufferSizeCallback(window, windowResizeCallback);
    glfwSetWindowCloseCallback(window, windowCloseRequestCallback);
    glfwSetKeyCallback(window, keyEventCallback);

    logInfo("Initializing OpenGL...\n");
    glfwMakeContextCurrent(window);
    glfwSwapInterval(config.vsync ? 1 : 0);
    if(!Render::Setup())
    {
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }
    glClearColor(0.1f, 0.2f, 0.3f, 1.0f);

    int framebufferWidth, framebufferHeight;
    glfwGetFramebufferSize(window, &framebufferWidth, &framebufferHeight);
    Render::updateWindowSize(framebufferWidth, framebufferHeight);

    ShaderVariant variant;
    SpriteProgram program = {};
    if(!Render::chooseVariant(config.binding, &variant) ||
       !Render::createSpriteProgram(variant, &program))
    {
        Render::Shutdown();
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }
    if(config.constantTriangle && !variant.hasConstantTriangle)
    {
        logWarn("The %s binding has no constant triangle, drawing the sprite instead\n",
                bindingStrategyName(variant.binding));
    }

    Texture albedo;
    GLuint albedoTexture = 0;
    if(buildCheckerTexture(config.wrapMode, &albedo))
    {
        albedoTexture = Render::createTexture(albedo);
    }
    if(albedoTexture == 0)
    {
        Render::destroySpriteProgram(&program);
        Render::Shutdown();
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    SpriteVertex vertices[SPRITE_QUAD_VERTEX_COUNT];
    uint16 indices[SPRITE_QUAD_INDEX_COUNT];
    buildSpriteVertices(config, vertices, indices);

    SpriteMesh mesh;
    if(!Render::createSpriteMesh(program, vertices, SPRITE_QUAD_VERTEX_COUNT,
                                 indices, SPRITE_QUAD_INDEX_COUNT, &mesh))
    {
        Render::destroyTexture(albedoTexture);
        Render::destroySpriteProgram(&program);
        Render::Shutdown();
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    bool drawTriangle = config.constantTriangle && variant.hasConstantTriangle;
    int meshWidth = screenWidth;
    int meshHeight = screenHeight;
    FrameCounter frameCounter;
    double currentTime = glfwGetTime();
    double nextFpsLogTime = currentTime + FPS_LOG_INTERVAL;

    double frameDuration = 1.0/config.frameRate;
    double nextFrameTime = Platform::SecondsSinceStartup();
    if(!config.vsync)
    {
        logInfo("Vsync disabled, pacing frames to %dfps\n", config.frameRate);
    }

    Render::glPrintError(true);
    logInfo("Setup complete after %.3fs, start running...\n", Platform::SecondsSinceStartup());
    while(state.isRunning)
    {
        double newTime = glfwGetTime();
        frameCounter.add((float)(newTime - currentTime));
        currentTime = newTime;

        glfwPollEvents();

        if((screenWidth != meshWidth) || (screenHeight != meshHeight))
        {
            buildSpriteVertices(config, vertices, indices);
            if(!Render::updateSpriteMesh(mesh, vertices, SPRITE_QUAD_VERTEX_COUNT))
            {
                state.isRunning = false;
            }
            meshWidth = screenWidth;
            meshHeight = screenHeight;
        }

        glClear(GL_COLOR_BUFFER_BIT);
        if(drawTriangle)
        {
            Render::drawConstantTriangle(program, mesh, albedoTexture);
        }
        else
        {
            Render::drawSpriteMesh(program, mesh, albedoTexture);
        }

        glfwSwapBuffers(window);
        Render::glPrintError(false);

        if(currentTime >= nextFpsLogTime)
        {
            logTerm("%.1ffps\n", frameCounter.fps());
            nextFpsLogTime = currentTime + FPS_LOG_INTERVAL;
        }

        if(!config.vsync)
        {
            // Sleep till the next scheduled frame
            nextFrameTime += frameDuration;
            double sleepSeconds = nextFrameTime - Platform::SecondsSinceStartup();
            if(sleepSeconds > 0.0)
            {
                uint32 sleepMS = (uint32)(sleepSeconds*1000);
                Platform::SleepForMilliseconds(sleepMS);
            }
        }
    }
    logInfo("Begin shutdown\n");

    Render::destroySpriteMesh(&mesh);
    Render::destroyTexture(albedoTexture);
    Render::destroySpriteProgram(&program);
    Render::Shutdown();

    logInfo("Destroy window\n");
    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}

int main(int argc, char** argv)
{
    DemoConfig config = defaultDemoConfig();
    if(!parseCommandLine(argc, argv, &config))
    {
        printUsage(argv[0]);
        return 1;
    }
    if(config.showHelp)
    {
        printUsage(argv[0]);
        return 0;
    }

    if(!Platform::Setup())
    {
        return 1;
    }
    if(!initLogging(config.logFilename.c_str()))
    {
        Platform::Shutdown();
        return 1;
    }
    setLogLevel(config.verbose ? LOG_DBUG : LOG_INFO);
    logInfo("Sprite shader demo version %s\n", BUILD_VERSION);
    logInfo("Binding %s, wrap %s, tint (%.2f, %.2f, %.2f, %.2f)\n",
            bindingChoiceName(config.binding), textureWrapModeName(config.wrapMode),
            config.tint.x, config.tint.y, config.tint.z, config.tint.w);

    int result = runDemo(config);

    logInfo("Shutdown complete\n");
    deinitLogging();
    Platform::Shutdown();
    return result;
}
