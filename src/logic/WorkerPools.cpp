#include "WorkerPools.hpp"

#include "DecodeJob.hpp"

#include <QThreadPool>
#include <QtDebug>
#include <stdexcept>

struct WorkerPools::Impl
{
    QThreadPool thumbnails;
    QThreadPool images;
    Sender<OperationEvent> sink;
    ShutdownFlag shutdown;
    bool finished = false;
};

WorkerPools::WorkerPools(int thumbnailThreads, int imageThreads, Sender<OperationEvent> sink, ShutdownFlag shutdown)
    : d(std::make_unique<Impl>())
{
    d->sink = std::move(sink);
    d->shutdown = std::move(shutdown);

    d->thumbnails.setObjectName("Thumbnail Pool");
    d->thumbnails.setMaxThreadCount(thumbnailThreads);
    d->images.setObjectName("Image Pool");
    d->images.setMaxThreadCount(imageThreads);

    qInfo() << "Started worker pools with" << d->thumbnails.maxThreadCount() << "thumbnail and" << d->images.maxThreadCount() << "image threads";
}

WorkerPools::~WorkerPools()
{
    this->finish();
}

void WorkerPools::submitThumbnail(const QString& path, int targetSize)
{
    if(d->finished)
    {
        throw std::logic_error("WorkerPools::submitThumbnail() called after finish()");
    }
    d->thumbnails.start(DecodeJob::thumbnail(path, targetSize, d->sink, d->shutdown));
}

void WorkerPools::submitImage(const QString& path)
{
    if(d->finished)
    {
        throw std::logic_error("WorkerPools::submitImage() called after finish()");
    }
    d->images.start(DecodeJob::fullImage(path, d->sink, d->shutdown));
}

QThreadPool* WorkerPools::thumbnailPool()
{
    return &d->thumbnails;
}

QThreadPool* WorkerPools::imagePool()
{
    return &d->images;
}

void WorkerPools::finish()
{
    d->finished = true;
    d->thumbnails.waitForDone();
    d->images.waitForDone();
    d->sink.release();
}
