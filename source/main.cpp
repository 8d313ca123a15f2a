#include "platform/platform.hpp"


void start(Platform&, u32 frame_limit);


int main()
{
    Platform pf;

    // Zero: the frame limit comes from the configuration, where a limit of
    // zero means forever.
    start(pf, 0);
}
