#pragma once
#include <atomic>

// Debug output (per-pass filter counts, raw sizes) is printed only when
// verbose is on. Everything else goes straight to std::cout / std::cerr.
class Log
{
public:
    static void setVerbose(bool on) { verbose.store(on, std::memory_order_relaxed); }
    static bool isVerbose() { return verbose.load(std::memory_order_relaxed); }

private:
    static inline std::atomic<bool> verbose{false};
};
