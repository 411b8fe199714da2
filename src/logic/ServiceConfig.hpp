#pragma once

#include <chrono>

struct ServiceConfig
{
    static constexpr int MaxDefaultThreads = 4;
    static constexpr std::chrono::milliseconds DefaultDebounce{ 10000 };

    // min(idealThreadCount, MaxDefaultThreads)
    static int defaultThreadCount();

    int thumbnailThreads = defaultThreadCount();
    int imageThreads = defaultThreadCount();

    // window over which the directory watcher coalesces changes before reporting them
    std::chrono::milliseconds debounce = DefaultDebounce;
};
