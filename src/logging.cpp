#include <assert.h>
#include <stdio.h>

#include "logging.h"
#include "platform.h"

static FILE* logFile = nullptr;
static LogLevel minimumLogLevel = LOG_INFO;

static const char* getFileNameFromPath(const char* filePath)
{
    const char* baseName = filePath;

    for(const char* currentName=filePath; *currentName != 0; ++currentName)
    {
        char currentChar = *currentName;
        if((currentChar == '/') || (currentChar == '\\'))
        {
            baseName = currentName+1;
        }
    }

    return baseName;
}

void setLogLevel(LogLevel minimumLevel)
{
    assert((minimumLevel >= LOG_DBUG) && (minimumLevel <= LOG_FAIL));
    minimumLogLevel = minimumLevel;
}

LogLevel getLogLevel()
{
    return minimumLogLevel;
}

void _log(LogLevel level, bool logToTerminal, bool logToFile,
          const char* filePath, int lineNumber, const char* msgFormat, ...)
{
    assert((level >= LOG_DBUG) && (level <= LOG_FAIL));
    if(level < minimumLogLevel)
    {
        return;
    }
    const char* logLevelLabels[] = {"DBUG", "INFO", "WARN", "FAIL"};

    const char* fileName = getFileNameFromPath(filePath);

    Platform::DateTime currentTime = Platform::GetLocalDateTime();
    char timeBuffer[64];
    snprintf(timeBuffer, sizeof(timeBuffer), "%02u:%02u:%02u.%03u",
             currentTime.Hour, currentTime.Minute, currentTime.Second, currentTime.Millisecond);

    va_list stderrArgs;
    va_list fileArgs;
    va_start(stderrArgs, msgFormat);
    va_copy(fileArgs, stderrArgs);
    if(logToTerminal)
    {
        fprintf(stderr, "%s [%s] %16s:%-3d - ",
                timeBuffer, logLevelLabels[level], fileName, lineNumber);
        vfprintf(stderr, msgFormat, stderrArgs);
    }
    if(logToFile && (logFile != nullptr))
    {
        fprintf(logFile, "%s [%s] %16s:%-3d - ",
                timeBuffer, logLevelLabels[level], fileName, lineNumber);
        vfprintf(logFile, msgFormat, fileArgs);
        fflush(logFile);
    }
    va_end(fileArgs);
    va_end(stderrArgs);
}


bool initLogging(const char* filename)
{
    if(filename == nullptr)
    {
        logFile = nullptr;
        return true;
    }

    logFile = fopen(filename, "w");
    if(!logFile)
    {
        // NOTE: We can survive without a log file, messages still reach the terminal
        fprintf(stderr, "Error: Unable to create log file %s\n", filename);
    }
    return true;
}

void deinitLogging()
{
    fflush(stderr);
    if(logFile != nullptr)
    {
        fclose(logFile);
        logFile = nullptr;
    }
}
