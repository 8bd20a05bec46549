#pragma once
#include <atomic>
#include <chrono>
#include <ctime>

// Source of "now" for every derived view. Replay pins it to the recording
// time of the chunk being served so minutes-until matches what was seen live.
class VirtualClock
{
public:
    static void set(std::time_t t)
    {
        value.store(t, std::memory_order_relaxed);
        enabled.store(true, std::memory_order_relaxed);
    }

    static void disable()
    {
        enabled.store(false, std::memory_order_relaxed);
    }

    static bool isPinned()
    {
        return enabled.load(std::memory_order_relaxed);
    }

    static std::chrono::system_clock::time_point now()
    {
        if (enabled.load(std::memory_order_relaxed))
            return std::chrono::system_clock::from_time_t(value.load(std::memory_order_relaxed));
        return std::chrono::system_clock::now();
    }

private:
    static std::atomic<bool> enabled;
    static std::atomic<std::time_t> value;
};
