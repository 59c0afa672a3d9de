#include "catch.hpp"

#include "config.h"

TEST_CASE("No arguments keeps the defaults")
{
    DemoConfig config = defaultDemoConfig();
    const char* argv[] = {"spriteshade_demo"};

    REQUIRE(parseCommandLine(1, argv, &config));
    REQUIRE(config.windowWidth == 1024);
    REQUIRE(config.windowHeight == 768);
    REQUIRE(config.binding == BINDING_CHOICE_AUTO);
    REQUIRE_FALSE(config.constantTriangle);
    REQUIRE(config.wrapMode == WRAP_CLAMP_TO_EDGE);
    REQUIRE(config.tint == Vector4(1.0f, 1.0f, 1.0f, 1.0f));
    REQUIRE(config.vsync);
    REQUIRE(config.frameRate == 60);
    REQUIRE(config.logFilename == "spriteshade.log");
    REQUIRE_FALSE(config.verbose);
    REQUIRE_FALSE(config.showHelp);
}

TEST_CASE("All options are applied")
{
    DemoConfig config = defaultDemoConfig();
    const char* argv[] = {"spriteshade_demo", "--width=640", "--height=480", "--binding=explicit",
                          "--triangle", "--wrap=mirror", "--tint=0.5,0.25,1,0.75",
                          "--log=other.log", "--verbose"};

    REQUIRE(parseCommandLine(9, argv, &config));
    REQUIRE(config.windowWidth == 640);
    REQUIRE(config.windowHeight == 480);
    REQUIRE(config.binding == BINDING_CHOICE_EXPLICIT);
    REQUIRE(config.constantTriangle);
    REQUIRE(config.wrapMode == WRAP_MIRRORED_REPEAT);
    REQUIRE(config.tint == Vector4(0.5f, 0.25f, 1.0f, 0.75f));
    REQUIRE(config.logFilename == "other.log");
    REQUIRE(config.verbose);
}

TEST_CASE("Help is recognised in both spellings")
{
    DemoConfig longForm = defaultDemoConfig();
    DemoConfig shortForm = defaultDemoConfig();
    const char* longArgv[] = {"spriteshade_demo", "--help"};
    const char* shortArgv[] = {"spriteshade_demo", "-h"};

    REQUIRE(parseCommandLine(2, longArgv, &longForm));
    REQUIRE(parseCommandLine(2, shortArgv, &shortForm));
    REQUIRE(longForm.showHelp);
    REQUIRE(shortForm.showHelp);
}

TEST_CASE("Unknown options are rejected")
{
    DemoConfig config = defaultDemoConfig();
    const char* argv[] = {"spriteshade_demo", "--fullscreen"};

    REQUIRE_FALSE(parseCommandLine(2, argv, &config));
}

TEST_CASE("Window sizes must be positive integers")
{
    const char* badValues[] = {"--width=0", "--width=-5", "--width=12px", "--height=", "--height=abc"};

    for(const char* badValue : badValues)
    {
        DemoConfig config = defaultDemoConfig();
        const char* argv[] = {"spriteshade_demo", badValue};
        REQUIRE_FALSE(parseCommandLine(2, argv, &config));
    }
}

TEST_CASE("Unknown binding and wrap names are rejected")
{
    DemoConfig config = defaultDemoConfig();
    const char* bindingArgv[] = {"spriteshade_demo", "--binding=magic"};
    const char* wrapArgv[] = {"spriteshade_demo", "--wrap=border"};

    REQUIRE_FALSE(parseCommandLine(2, bindingArgv, &config));
    REQUIRE_FALSE(parseCommandLine(2, wrapArgv, &config));
}

TEST_CASE("A tint needs exactly four components")
{
    DemoConfig config = defaultDemoConfig();
    const char* shortArgv[] = {"spriteshade_demo", "--tint=1,1,1"};
    const char* longArgv[] = {"spriteshade_demo", "--tint=1,1,1,1,1"};

    REQUIRE_FALSE(parseCommandLine(2, shortArgv, &config));
    REQUIRE_FALSE(parseCommandLine(2, longArgv, &config));
}

TEST_CASE("Later options override earlier ones")
{
    DemoConfig config = defaultDemoConfig();
    const char* argv[] = {"spriteshade_demo", "--binding=explicit", "--binding=implicit"};

    REQUIRE(parseCommandLine(3, argv, &config));
    REQUIRE(config.binding == BINDING_CHOICE_IMPLICIT);
}

TEST_CASE("Turning off vsync selects sleep-paced frames at the requested rate")
{
    DemoConfig config = defaultDemoConfig();
    const char* argv[] = {"spriteshade_demo", "--no-vsync", "--fps=30"};

    REQUIRE(parseCommandLine(3, argv, &config));
    REQUIRE_FALSE(config.vsync);
    REQUIRE(config.frameRate == 30);
}

TEST_CASE("Frame rates outside 1 to 1000 are rejected")
{
    DemoConfig config = defaultDemoConfig();
    const char* zero[] = {"spriteshade_demo", "--fps=0"};
    const char* tooFast[] = {"spriteshade_demo", "--fps=1001"};
    const char* notANumber[] = {"spriteshade_demo", "--fps=fast"};

    REQUIRE_FALSE(parseCommandLine(2, zero, &config));
    REQUIRE_FALSE(parseCommandLine(2, tooFast, &config));
    REQUIRE_FALSE(parseCommandLine(2, notANumber, &config));
    REQUIRE(config.frameRate == 60);
}
