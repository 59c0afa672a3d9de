#include <time.h>
#include <unistd.h>

#include "platform.h"

static double clockSetupTime;

static double GetClockSeconds()
{
    timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);

    return ((double)ts.tv_sec) + (((double)ts.tv_nsec)/1000000000.0);
}

double Platform::SecondsSinceStartup()
{
    return GetClockSeconds() - clockSetupTime;
}

void Platform::SleepForMilliseconds(uint32_t milliseconds)
{
    usleep(1000*milliseconds);
}

Platform::DateTime Platform::GetLocalDateTime()
{
    timespec now;
    clock_gettime(CLOCK_REALTIME, &now);

    uint16_t nowMillis = (uint16_t)(now.tv_nsec/1000000);
    struct tm nowSplit = {};
    localtime_r(&now.tv_sec, &nowSplit);

    DateTime result = {};
    result.Year = (uint16_t)(nowSplit.tm_year + 1900);
    result.Month = (uint16_t)(nowSplit.tm_mon + 1);
    result.Day = (uint16_t)nowSplit.tm_mday;
    result.Hour = (uint16_t)nowSplit.tm_hour;
    result.Minute = (uint16_t)nowSplit.tm_min;
    result.Second = (uint16_t)nowSplit.tm_sec;
    result.Millisecond = nowMillis;
    return result;
}

bool Platform::Setup()
{
    timespec startupTs;
    if(clock_gettime(CLOCK_MONOTONIC, &startupTs) != 0)
    {
        return false;
    }

    clockSetupTime = GetClockSeconds();
    return true;
}

void Platform::Shutdown()
{
}
