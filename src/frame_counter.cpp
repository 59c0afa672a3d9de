#include <float.h>
#include <math.h>

#include "frame_counter.h"

FrameCounter::FrameCounter()
    : snapshot(0.0f), cursor(0)
{
    for(int i=0; i<FRAME_COUNTER_WINDOW; i++)
    {
        frameTimes[i] = 0.0f;
    }
}

void FrameCounter::add(float frameSeconds)
{
    frameTimes[cursor] = frameSeconds;
    if(cursor == 0)
    {
        takeSnapshot();
    }
    cursor = (cursor + 1) % FRAME_COUNTER_WINDOW;
}

float FrameCounter::fps() const
{
    return snapshot;
}

void FrameCounter::takeSnapshot()
{
    float sum = 0.0f;
    for(int i=0; i<FRAME_COUNTER_WINDOW; i++)
    {
        sum += frameTimes[i];
    }
    float average = sum / (float)FRAME_COUNTER_WINDOW;

    if(fabsf(average) > FLT_EPSILON)
    {
        snapshot = 1.0f/average;
    }
}
