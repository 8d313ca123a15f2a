#include "frameLoop.hpp"
#include "platform/platform.hpp"
#include "util.hpp"


FrameDriver::FrameDriver(Platform& pfrm, ObjectAllocator& objects)
    : pfrm_(pfrm), objects_(objects), gate_(pfrm)
{
}


void FrameDriver::start()
{
    {
        auto vblank = gate_.vblank();
        objects_.reset(vblank);
    }

    gate_.wait_for(Window::visible);
}


HOT void FrameDriver::step(FrameClient& client)
{
    keypad_.poll();

    client.logic(pfrm_, state_, keypad_);

    {
        auto vblank = gate_.vblank();
        objects_.flush(vblank);
        client.draw(pfrm_, state_, vblank);
    }

    gate_.wait_for(Window::visible);

    state_.advance();
}


u32 FrameDriver::run(FrameClient& client, u32 frame_limit)
{
    u32 frames = 0;

    while (pfrm_.is_running()) {
        if (frame_limit and frames == frame_limit) {
            break;
        }

        step(client);
        ++frames;
    }

    return frames;
}
