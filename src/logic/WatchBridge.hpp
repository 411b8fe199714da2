#pragma once

#include "Channel.hpp"
#include "ShutdownFlag.hpp"
#include "types.hpp"

#include <memory>

/**
 * Pure transport: a dedicated thread moves every notification of the directory watcher into the funnel's watch input.
 * It ends once the watcher's channel closes or the funnel stops listening.
 */
class WatchBridge
{
public:
    WatchBridge(Receiver<RawWatchEvent> native, Sender<RawWatchEvent> forward, ShutdownFlag shutdown);
    // waits for the thread to run out, which requires the native channel to be closed
    ~WatchBridge();

    WatchBridge(const WatchBridge&) = delete;
    WatchBridge& operator=(const WatchBridge&) = delete;

    void start();
    bool isRunning() const;
    void wait();

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
