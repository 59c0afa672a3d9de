#ifndef _LOGGING_H
#define _LOGGING_H

#include <stdio.h>
#include <stdarg.h>


/* Log Levels:
 * Dbug: High-frequency diagnostics (frame timings, uniform updates), hidden unless verbose
 * Info: Information that could be useful but is not a problem
 * Warn: Errors/situations that are bad but recoverable (rejected texture data, bad options)
 * Fail: Errors/failures that we cannot recover from (shader compile/link, context creation)
 */
enum LogLevel
{
    LOG_DBUG,
    LOG_INFO,
    LOG_WARN,
    LOG_FAIL
};

// Passing a null filename logs to the terminal only
bool initLogging(const char* filename);
void deinitLogging();

// Messages below this level are dropped, defaults to LOG_INFO
void setLogLevel(LogLevel minimumLevel);
LogLevel getLogLevel();

void _log(LogLevel level, bool logToTerminal, bool logToFile,
          const char* filePath, int lineNumber, const char* msgFormat, ...);

#ifdef NDEBUG
#define logTerm(MSG, ...)
#define logFile(MSG, ...)

#define logInfo(MSG, ...)
#define logWarn(MSG, ...)
#define logFail(MSG, ...)
#else
#define logFile(MSG, ...)     _log(LOG_INFO, false, true, __FILE__, __LINE__, MSG, ##__VA_ARGS__)
#define logTerm(MSG, ...)     _log(LOG_DBUG, true, false, __FILE__, __LINE__, MSG, ##__VA_ARGS__)

#define logInfo(MSG, ...)     _log(LOG_INFO, true, true,  __FILE__, __LINE__, MSG, ##__VA_ARGS__)
#define logWarn(MSG, ...)     _log(LOG_WARN, true, true,  __FILE__, __LINE__, MSG, ##__VA_ARGS__)
#define logFail(MSG, ...)     _log(LOG_FAIL, true, true,  __FILE__, __LINE__, MSG, ##__VA_ARGS__)
#endif // NDEBUG

#endif
