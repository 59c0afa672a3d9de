#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "common.h"
#include "config.h"
#include "logging.h"

DemoConfig defaultDemoConfig()
{
    DemoConfig result;
    result.windowWidth = DEFAULT_WINDOW_WIDTH;
    result.windowHeight = DEFAULT_WINDOW_HEIGHT;
    result.binding = BINDING_CHOICE_AUTO;
    result.constantTriangle = false;
    result.wrapMode = WRAP_CLAMP_TO_EDGE;
    result.tint = Vector4(1.0f, 1.0f, 1.0f, 1.0f);
    result.vsync = true;
    result.frameRate = DEFAULT_FRAME_RATE;
    result.logFilename = "spriteshade.log";
    result.verbose = false;
    result.showHelp = false;
    return result;
}

// Returns the text after "--name=" if arg is that option, otherwise nullptr
static const char* optionValue(const char* arg, const char* name)
{
    size_t nameLength = strlen(name);
    if((strncmp(arg, name, nameLength) == 0) && (arg[nameLength] == '='))
    {
        return arg + nameLength + 1;
    }
    return nullptr;
}

static bool parsePositiveInt(const char* text, int maxValue, int* result)
{
    char* end = nullptr;
    long value = strtol(text, &end, 10);
    if((end == text) || (*end != '\0') || (value <= 0) || (value > maxValue))
    {
        return false;
    }
    *result = (int)value;
    return true;
}

static bool parseTint(const char* text, Vector4* result)
{
    float components[4];
    const char* cursor = text;
    for(int i=0; i<4; i++)
    {
        char* end = nullptr;
        components[i] = strtof(cursor, &end);
        if(end == cursor)
        {
            return false;
        }

        char expectedSeparator = (i < 3) ? ',' : '\0';
        if(*end != expectedSeparator)
        {
            return false;
        }
        cursor = end + 1;
    }

    *result = Vector4(components[0], components[1], components[2], components[3]);
    return true;
}

bool parseCommandLine(int argc, const char* const* argv, DemoConfig* config)
{
    for(int argIndex=1; argIndex<argc; argIndex++)
    {
        const char* arg = argv[argIndex];
        const char* value;

        if((strcmp(arg, "--help") == 0) || (strcmp(arg, "-h") == 0))
        {
            config->showHelp = true;
        }
        else if(strcmp(arg, "--triangle") == 0)
        {
            config->constantTriangle = true;
        }
        else if(strcmp(arg, "--verbose") == 0)
        {
            config->verbose = true;
        }
        else if(strcmp(arg, "--no-vsync") == 0)
        {
            config->vsync = false;
        }
        else if((value = optionValue(arg, "--fps")) != nullptr)
        {
            if(!parsePositiveInt(value, MAX_FRAME_RATE, &config->frameRate))
            {
                logWarn("Invalid frame rate: %s\n", value);
                return false;
            }
        }
        else if((value = optionValue(arg, "--width")) != nullptr)
        {
            if(!parsePositiveInt(value, MAX_WINDOW_DIMENSION, &config->windowWidth))
            {
                logWarn("Invalid window width: %s\n", value);
                return false;
            }
        }
        else if((value = optionValue(arg, "--height")) != nullptr)
        {
            if(!parsePositiveInt(value, MAX_WINDOW_DIMENSION, &config->windowHeight))
            {
                logWarn("Invalid window height: %s\n", value);
                return false;
            }
        }
        else if((value = optionValue(arg, "--binding")) != nullptr)
        {
            if(strcmp(value, "auto") == 0)
                config->binding = BINDING_CHOICE_AUTO;
            else if(strcmp(value, "implicit") == 0)
                config->binding = BINDING_CHOICE_IMPLICIT;
            else if(strcmp(value, "explicit") == 0)
                config->binding = BINDING_CHOICE_EXPLICIT;
            else
            {
                logWarn("Unknown binding strategy: %s\n", value);
                return false;
            }
        }
        else if((value = optionValue(arg, "--wrap")) != nullptr)
        {
            if(strcmp(value, "clamp") == 0)
                config->wrapMode = WRAP_CLAMP_TO_EDGE;
            else if(strcmp(value, "repeat") == 0)
                config->wrapMode = WRAP_REPEAT;
            else if(strcmp(value, "mirror") == 0)
                config->wrapMode = WRAP_MIRRORED_REPEAT;
            else
            {
                logWarn("Unknown texture wrap mode: %s\n", value);
                return false;
            }
        }
        else if((value = optionValue(arg, "--tint")) != nullptr)
        {
            if(!parseTint(value, &config->tint))
            {
                logWarn("Invalid tint, expected r,g,b,a: %s\n", value);
                return false;
            }
        }
        else if((value = optionValue(arg, "--log")) != nullptr)
        {
            if(*value == '\0')
            {
                logWarn("Empty log filename\n");
                return false;
            }
            config->logFilename = value;
        }
        else
        {
            logWarn("Unrecognized option: %s\n", arg);
            return false;
        }
    }

    return true;
}

const char* bindingChoiceName(BindingChoice choice)
{
    switch(choice)
    {
    case BINDING_CHOICE_AUTO:
        return "auto";
    case BINDING_CHOICE_IMPLICIT:
        return "implicit";
    case BINDING_CHOICE_EXPLICIT:
        return "explicit";
    }
    return "unknown";
}

void printUsage(const char* programName)
{
    printf("Usage: %s [options]\n", programName);
    printf("  --width=N                      Initial window width in pixels (default %d)\n",
           DEFAULT_WINDOW_WIDTH);
    printf("  --height=N                     Initial window height in pixels (default %d)\n",
           DEFAULT_WINDOW_HEIGHT);
    printf("  --binding=auto|implicit|explicit\n");
    printf("                                 How shader inputs are bound (default auto)\n");
    printf("  --triangle                     Draw the fixed debug triangle instead of the sprite\n");
    printf("  --wrap=clamp|repeat|mirror     Albedo texture wrap mode (default clamp)\n");
    printf("  --tint=r,g,b,a                 Sprite vertex colour (default 1,1,1,1)\n");
    printf("  --no-vsync                     Pace frames with a sleep instead of the swap interval\n");
    printf("  --fps=N                        Frame rate used with --no-vsync (default %d)\n",
           DEFAULT_FRAME_RATE);
    printf("  --log=FILE                     Log file (default spriteshade.log)\n");
    printf("  --verbose                      Also log debug messages\n");
    printf("  --help                         Show this message\n");
}
