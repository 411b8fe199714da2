#include "WatchBridge.hpp"

#include <QScopedPointer>
#include <QThread>
#include <QtDebug>

struct WatchBridge::Impl
{
    Receiver<RawWatchEvent> native;
    Sender<RawWatchEvent> forward;
    ShutdownFlag shutdown;

    QScopedPointer<QThread> thread;

    Impl(Receiver<RawWatchEvent> n, Sender<RawWatchEvent> f, ShutdownFlag s)
        : native(std::move(n)), forward(std::move(f)), shutdown(std::move(s))
    {}

    void run()
    {
        while(std::optional<RawWatchEvent> e = this->native.recv())
        {
            if(!this->forward.send(std::move(*e)))
            {
                if(!this->shutdown.isSet())
                {
                    qCritical() << "Failed to forward a directory watch event, the event funnel is gone";
                }
                this->forward.release();
                return;
            }
        }

        if(!this->shutdown.isSet())
        {
            qCritical() << "Directory watch bridge ended, the watcher closed its channel";
        }
        this->forward.release();
    }
};

WatchBridge::WatchBridge(Receiver<RawWatchEvent> native, Sender<RawWatchEvent> forward, ShutdownFlag shutdown)
    : d(std::make_unique<Impl>(std::move(native), std::move(forward), std::move(shutdown)))
{}

WatchBridge::~WatchBridge()
{
    this->wait();
}

void WatchBridge::start()
{
    d->thread.reset(QThread::create([this]() { d->run(); }));
    d->thread->setObjectName("Watch Bridge");
    d->thread->start();
}

bool WatchBridge::isRunning() const
{
    return d->thread && d->thread->isRunning();
}

void WatchBridge::wait()
{
    if(d->thread)
    {
        d->thread->wait();
    }
}
