#pragma once

#include "Channel.hpp"
#include "ShutdownFlag.hpp"
#include "types.hpp"

#include <functional>
#include <memory>
#include <optional>

/**
 * Multiplexes the watch input and the worker completions into the single output stream.
 *
 * A dedicated thread blocks on both inputs at once, takes exactly one ready item at a time, classifies raw watch
 * events and forwards the result. After each successful forward the notify hook is invoked once.
 * The thread ends as soon as the output's receiver is gone or one of the inputs disconnects.
 */
class EventFunnel
{
public:
    using NotifyHook = std::function<void()>;

    // watchInput is empty if no directory is being watched
    EventFunnel(std::optional<Receiver<RawWatchEvent>> watchInput,
                Receiver<OperationEvent> operationInput,
                Sender<OutputEvent> output,
                NotifyHook notify,
                ShutdownFlag shutdown);
    ~EventFunnel();

    EventFunnel(const EventFunnel&) = delete;
    EventFunnel& operator=(const EventFunnel&) = delete;

    void start();
    bool isRunning() const;
    void wait();

    // Maps a raw watch notification onto the consumer-facing shape. Empty if the event is to be dropped.
    static std::optional<FileEvent> classify(const RawWatchEvent& e);

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
