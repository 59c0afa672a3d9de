#ifndef _FRAME_COUNTER_H
#define _FRAME_COUNTER_H

const int FRAME_COUNTER_WINDOW = 60;

// Measures frames per second over a rolling window of frame durations.
// The reported value only changes once per trip around the window, which keeps it
// readable when printed every frame.
class FrameCounter
{
public:
    FrameCounter();

    void add(float frameSeconds);

    // Returns 0 until the first non-zero snapshot has been taken
    float fps() const;

private:
    float frameTimes[FRAME_COUNTER_WINDOW];
    float snapshot;
    int cursor;

    void takeSnapshot();
};

#endif
