#pragma once

#include <QtGlobal>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

enum class ChannelStatus
{
    Ok,
    Empty,
    // every sender has been released and the queue is drained
    Disconnected,
};

/**
 * Lets a single consumer block on several receivers at once.
 * Every send or disconnect on an attached channel bumps the generation counter.
 */
class ChannelWaker
{
public:
    ChannelWaker() = default;
    ChannelWaker(const ChannelWaker&) = delete;
    ChannelWaker& operator=(const ChannelWaker&) = delete;

    quint64 generation() const
    {
        std::lock_guard<std::mutex> l(m);
        return gen;
    }

    void notify()
    {
        {
            std::lock_guard<std::mutex> l(m);
            ++gen;
        }
        cv.notify_all();
    }

    // Returns as soon as the generation differs from the one observed by the caller.
    void wait(quint64 seen)
    {
        std::unique_lock<std::mutex> l(m);
        cv.wait(l, [&]() { return gen != seen; });
    }

private:
    mutable std::mutex m;
    std::condition_variable cv;
    quint64 gen = 0;
};

template<typename T>
struct ChannelState
{
    std::mutex m;
    std::condition_variable cv;
    std::deque<T> queue;
    int senders = 0;
    bool receiverAlive = true;
    std::shared_ptr<ChannelWaker> waker;

    bool isReadyLocked() const
    {
        return !queue.empty() || senders == 0;
    }
};

/**
 * Producer side of an unbounded many-producer, single-consumer channel.
 * Copies share the channel; the channel disconnects once the last copy is released.
 */
template<typename T>
class Sender
{
public:
    Sender() = default;

    explicit Sender(std::shared_ptr<ChannelState<T>> state) : s(std::move(state))
    {
        if(s)
        {
            std::lock_guard<std::mutex> l(s->m);
            ++s->senders;
        }
    }

    Sender(const Sender& other) : Sender(other.s)
    {}

    Sender(Sender&& other) noexcept : s(std::move(other.s))
    {}

    Sender& operator=(Sender other) noexcept
    {
        this->release();
        s = std::move(other.s);
        return *this;
    }

    ~Sender()
    {
        this->release();
    }

    // Returns false if the receiver is gone; the value is dropped in that case.
    bool send(T value)
    {
        if(!s)
        {
            return false;
        }

        std::shared_ptr<ChannelWaker> w;
        {
            std::lock_guard<std::mutex> l(s->m);
            if(!s->receiverAlive)
            {
                return false;
            }
            s->queue.push_back(std::move(value));
            w = s->waker;
        }

        s->cv.notify_one();
        if(w)
        {
            w->notify();
        }
        return true;
    }

    bool isConnected() const
    {
        if(!s)
        {
            return false;
        }
        std::lock_guard<std::mutex> l(s->m);
        return s->receiverAlive;
    }

    void release() noexcept
    {
        if(!s)
        {
            return;
        }

        bool last;
        std::shared_ptr<ChannelWaker> w;
        {
            std::lock_guard<std::mutex> l(s->m);
            last = (--s->senders == 0);
            w = s->waker;
        }

        if(last)
        {
            s->cv.notify_all();
            if(w)
            {
                w->notify();
            }
        }
        s.reset();
    }

private:
    std::shared_ptr<ChannelState<T>> s;
};

/**
 * Consumer side of the channel. Move-only; destroying it makes every further send() fail.
 */
template<typename T>
class Receiver
{
public:
    Receiver() = default;

    explicit Receiver(std::shared_ptr<ChannelState<T>> state) : s(std::move(state))
    {}

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    Receiver(Receiver&& other) noexcept : s(std::move(other.s))
    {}

    Receiver& operator=(Receiver&& other) noexcept
    {
        if(this != &other)
        {
            this->close();
            s = std::move(other.s);
        }
        return *this;
    }

    ~Receiver()
    {
        this->close();
    }

    // Blocks until a value arrives. An empty optional means the channel is drained and disconnected.
    std::optional<T> recv()
    {
        if(!s)
        {
            return std::nullopt;
        }

        std::unique_lock<std::mutex> l(s->m);
        s->cv.wait(l, [&]() { return s->isReadyLocked(); });
        return this->popLocked();
    }

    template<typename Rep, typename Period>
    std::optional<T> recvFor(const std::chrono::duration<Rep, Period>& timeout)
    {
        if(!s)
        {
            return std::nullopt;
        }

        std::unique_lock<std::mutex> l(s->m);
        s->cv.wait_for(l, timeout, [&]() { return s->isReadyLocked(); });
        return this->popLocked();
    }

    ChannelStatus tryRecv(T& out)
    {
        if(!s)
        {
            return ChannelStatus::Disconnected;
        }

        std::lock_guard<std::mutex> l(s->m);
        if(s->queue.empty())
        {
            return s->senders == 0 ? ChannelStatus::Disconnected : ChannelStatus::Empty;
        }

        out = std::move(s->queue.front());
        s->queue.pop_front();
        return ChannelStatus::Ok;
    }

    // true if recv() would not block, either because a value is queued or because the channel is disconnected
    bool isReady() const
    {
        if(!s)
        {
            return true;
        }
        std::lock_guard<std::mutex> l(s->m);
        return s->isReadyLocked();
    }

    void setWaker(std::shared_ptr<ChannelWaker> waker)
    {
        if(s)
        {
            std::lock_guard<std::mutex> l(s->m);
            s->waker = std::move(waker);
        }
    }

private:
    std::optional<T> popLocked()
    {
        if(s->queue.empty())
        {
            return std::nullopt;
        }

        std::optional<T> value(std::move(s->queue.front()));
        s->queue.pop_front();
        return value;
    }

    void close() noexcept
    {
        if(!s)
        {
            return;
        }

        std::deque<T> dropped;
        {
            std::lock_guard<std::mutex> l(s->m);
            s->receiverAlive = false;
            dropped.swap(s->queue);
            s->waker.reset();
        }
        s.reset();
    }

    std::shared_ptr<ChannelState<T>> s;
};

template<typename T>
std::pair<Sender<T>, Receiver<T>> makeChannel()
{
    auto state = std::make_shared<ChannelState<T>>();
    return { Sender<T>(state), Receiver<T>(state) };
}
