#include "DecodeJob.hpp"

#include "DecoderFactory.hpp"
#include "TraceTimer.hpp"

#include <QtDebug>
#include <typeinfo>

struct DecodeJob::Impl
{
    OperationKind kind;
    QString path;
    int targetSize;
    Sender<OperationEvent> sink;
    ShutdownFlag shutdown;
};

DecodeJob::DecodeJob(OperationKind kind, const QString& path, int targetSize, Sender<OperationEvent> sink, ShutdownFlag shutdown)
    : d(std::make_unique<Impl>(Impl{ kind, path, targetSize, std::move(sink), std::move(shutdown) }))
{
    this->setAutoDelete(true);
}

DecodeJob::~DecodeJob() = default;

DecodeJob* DecodeJob::fullImage(const QString& path, Sender<OperationEvent> sink, ShutdownFlag shutdown)
{
    return new DecodeJob(OperationKind::ImageLoaded, path, 0, std::move(sink), std::move(shutdown));
}

DecodeJob* DecodeJob::thumbnail(const QString& path, int targetSize, Sender<OperationEvent> sink, ShutdownFlag shutdown)
{
    return new DecodeJob(OperationKind::ThumbnailLoaded, path, targetSize, std::move(sink), std::move(shutdown));
}

DecodeResult DecodeJob::decode(OperationKind kind, const QString& path, int targetSize)
{
    auto* factory = DecoderFactory::globalInstance();

    try
    {
        if(kind == OperationKind::ThumbnailLoaded)
        {
            return factory->decodeThumbnail(path, targetSize);
        }

        return factory->decode(path);
    }
    catch(const std::exception& e)
    {
        qWarning() << "Failed to load" << toString(kind) << "for" << path << ":" << e.what();
        return DecodeError{ QString::fromStdString(e.what()) };
    }
}

void DecodeJob::run()
{
    DecodeResult result;
    {
        TraceTimer t(typeid(DecodeJob), SlowDecodeMs);
        t.setInfo(d->path.toStdString());
        result = decode(d->kind, d->path, d->targetSize);
    }

    if(!d->sink.send(OperationEvent{ d->kind, d->path, std::move(result) }))
    {
        if(!d->shutdown.isSet())
        {
            qCritical() << "Can't post the decoded" << toString(d->kind) << "of" << d->path << ", the event funnel is gone";
        }
    }
    d->sink.release();
}
