#pragma once

#include <atomic>
#include <memory>

/**
 * Process-wide "we are going down" marker, handed by value to every thread the service spawns.
 * All copies share one flag. It only decides whether a closed channel is worth an error message;
 * termination itself is driven by the channels.
 */
class ShutdownFlag
{
public:
    ShutdownFlag() : flag(std::make_shared<std::atomic<bool>>(false))
    {}

    void set()
    {
        flag->store(true, std::memory_order_relaxed);
    }

    bool isSet() const
    {
        return flag->load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag;
};
