#include "EventFunnel.hpp"

#include "DecoderFactory.hpp"

#include <QScopedPointer>
#include <QThread>
#include <QtDebug>

struct EventFunnel::Impl
{
    std::optional<Receiver<RawWatchEvent>> watchInput;
    Receiver<OperationEvent> operationInput;
    Sender<OutputEvent> output;
    NotifyHook notify;
    ShutdownFlag shutdown;

    std::shared_ptr<ChannelWaker> waker = std::make_shared<ChannelWaker>();
    QScopedPointer<QThread> thread;

    // which source to look at first, flipped after each item so that neither input can starve the other
    bool watchFirst = true;

    enum class Step
    {
        Forwarded,
        Idle,
        Stop,
    };

    Impl(std::optional<Receiver<RawWatchEvent>> w, Receiver<OperationEvent> o, Sender<OutputEvent> out, NotifyHook n, ShutdownFlag s)
        : watchInput(std::move(w)), operationInput(std::move(o)), output(std::move(out)), notify(std::move(n)), shutdown(std::move(s))
    {
        if(this->watchInput)
        {
            this->watchInput->setWaker(this->waker);
        }
        this->operationInput.setWaker(this->waker);
    }

    void inputGone(const char* which)
    {
        if(!this->shutdown.isSet())
        {
            qCritical() << "Event funnel stops, the" << which << "input has been disconnected";
        }
    }

    Step forward(OutputEvent&& e)
    {
        if(!this->output.send(std::move(e)))
        {
            if(!this->shutdown.isSet())
            {
                qCritical() << "Event funnel stops, nobody is reading the output anymore";
            }
            return Step::Stop;
        }

        if(this->notify)
        {
            this->notify();
        }
        return Step::Forwarded;
    }

    Step pollWatch()
    {
        if(!this->watchInput)
        {
            return Step::Idle;
        }

        RawWatchEvent raw;
        switch(this->watchInput->tryRecv(raw))
        {
        case ChannelStatus::Empty:
            return Step::Idle;
        case ChannelStatus::Disconnected:
            this->inputGone("directory watch");
            return Step::Stop;
        case ChannelStatus::Ok:
            break;
        }

        std::optional<FileEvent> fe = classify(raw);
        if(!fe)
        {
            qDebug() << "Dropping watch event for" << raw.path;
            // the item was consumed nevertheless
            return Step::Forwarded;
        }
        return this->forward(OutputEvent(std::move(*fe)));
    }

    Step pollOperations()
    {
        OperationEvent op;
        switch(this->operationInput.tryRecv(op))
        {
        case ChannelStatus::Empty:
            return Step::Idle;
        case ChannelStatus::Disconnected:
            this->inputGone("operation");
            return Step::Stop;
        case ChannelStatus::Ok:
            break;
        }
        return this->forward(OutputEvent(std::move(op)));
    }

    void run()
    {
        while(true)
        {
            // observed before polling, so that anything arriving in between wakes us up again
            const quint64 seen = this->waker->generation();

            Step first = this->watchFirst ? this->pollWatch() : this->pollOperations();
            Step second = Step::Idle;
            if(first == Step::Idle)
            {
                second = this->watchFirst ? this->pollOperations() : this->pollWatch();
            }

            if(first == Step::Stop || second == Step::Stop)
            {
                break;
            }

            if(first == Step::Idle && second == Step::Idle)
            {
                this->waker->wait(seen);
            }
            else
            {
                this->watchFirst = !this->watchFirst;
            }
        }

        // tell the consumer that there will be nothing more
        this->output.release();
    }
};

EventFunnel::EventFunnel(std::optional<Receiver<RawWatchEvent>> watchInput,
                         Receiver<OperationEvent> operationInput,
                         Sender<OutputEvent> output,
                         NotifyHook notify,
                         ShutdownFlag shutdown)
    : d(std::make_unique<Impl>(std::move(watchInput), std::move(operationInput), std::move(output), std::move(notify), std::move(shutdown)))
{}

EventFunnel::~EventFunnel()
{
    this->wait();
}

void EventFunnel::start()
{
    d->thread.reset(QThread::create([this]() { d->run(); }));
    d->thread->setObjectName("Event Funnel");
    d->thread->start();
}

bool EventFunnel::isRunning() const
{
    return d->thread && d->thread->isRunning();
}

void EventFunnel::wait()
{
    if(d->thread)
    {
        d->thread->wait();
    }
}

std::optional<FileEvent> EventFunnel::classify(const RawWatchEvent& e)
{
    auto* factory = DecoderFactory::globalInstance();

    switch(e.kind)
    {
    case RawWatchEvent::Kind::Create:
        if(factory->isImage(e.path))
        {
            return FileEvent{ FileEventKind::Added, e.path, QString() };
        }
        break;
    case RawWatchEvent::Kind::Write:
        if(factory->isImage(e.path))
        {
            return FileEvent{ FileEventKind::Modified, e.path, QString() };
        }
        break;
    case RawWatchEvent::Kind::Remove:
        return FileEvent{ FileEventKind::Removed, e.path, QString() };
    case RawWatchEvent::Kind::Rename:
        return FileEvent{ FileEventKind::Renamed, e.path, e.newPath };
    case RawWatchEvent::Kind::Other:
        break;
    }
    return std::nullopt;
}
