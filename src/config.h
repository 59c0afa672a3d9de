#ifndef _CONFIG_H
#define _CONFIG_H

#include <string>

#include "texture.h"
#include "vecmath.h"

enum BindingChoice
{
    BINDING_CHOICE_AUTO,     // Explicit if the driver exposes the extension, otherwise implicit
    BINDING_CHOICE_IMPLICIT,
    BINDING_CHOICE_EXPLICIT
};

struct DemoConfig
{
    int windowWidth;
    int windowHeight;

    BindingChoice binding;
    bool constantTriangle;
    TextureWrapMode wrapMode;
    Vector4 tint;

    // With vsync off the demo paces itself to frameRate using Platform::SleepForMilliseconds
    bool vsync;
    int frameRate;

    std::string logFilename;
    bool verbose;
    bool showHelp;
};

DemoConfig defaultDemoConfig();

// Applies --option=value style arguments on top of whatever config already holds.
// Returns false (after logging the offending argument) on unknown or malformed options.
bool parseCommandLine(int argc, const char* const* argv, DemoConfig* config);

const char* bindingChoiceName(BindingChoice choice);

void printUsage(const char* programName);

#endif
