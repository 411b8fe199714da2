#include "ImageFileService.hpp"

#include "DecoderFactory.hpp"
#include "DirectoryWatcher.hpp"
#include "EventFunnel.hpp"
#include "PathResolver.hpp"
#include "ShutdownFlag.hpp"
#include "WatchBridge.hpp"
#include "WorkerPools.hpp"

#include <QtDebug>
#include <algorithm>

struct ImageFileService::Impl
{
    ShutdownFlag shutdown;
    std::optional<QString> root;

    Receiver<OutputEvent> events;

    // declaration order matters for unwinding a half constructed service
    std::unique_ptr<DirectoryWatcher> watcher;
    std::unique_ptr<WatchBridge> bridge;
    std::unique_ptr<EventFunnel> funnel;
    std::unique_ptr<WorkerPools> pools;

    ~Impl()
    {
        // the watcher's thread releases the native channel, which ends the bridge, which disconnects the funnel's watch input
        if(this->watcher)
        {
            this->watcher->stopWatching();
        }
        if(this->pools)
        {
            // drain outstanding jobs and release the last handle on the operation channel
            this->pools->finish();
        }
        this->bridge.reset();
        this->funnel.reset();
        this->watcher.reset();
        this->pools.reset();
    }
};

ImageFileService::ImageFileService(const QStringList& paths, std::function<void()> notify, const ServiceConfig& config)
    : d(std::make_unique<Impl>())
{
    // make sure the factory is set up before any worker asks for it
    DecoderFactory::globalInstance();

    ResolvedPaths resolved = PathResolver::resolve(paths);
    d->root = resolved.root;

    auto [outputSender, outputReceiver] = makeChannel<OutputEvent>();
    auto [opSender, opReceiver] = makeChannel<OperationEvent>();
    d->events = std::move(outputReceiver);

    std::optional<Receiver<RawWatchEvent>> watchInput;
    if(d->root)
    {
        auto [nativeSender, nativeReceiver] = makeChannel<RawWatchEvent>();
        auto [forwardSender, forwardReceiver] = makeChannel<RawWatchEvent>();

        d->watcher = std::make_unique<DirectoryWatcher>(*d->root, config.debounce, std::move(nativeSender));
        d->watcher->startWatching();

        d->bridge = std::make_unique<WatchBridge>(std::move(nativeReceiver), std::move(forwardSender), d->shutdown);
        d->bridge->start();

        watchInput = std::move(forwardReceiver);
    }
    else
    {
        qInfo() << "Not watching any directory, the input does not collapse onto a single one";
    }

    d->pools = std::make_unique<WorkerPools>(config.thumbnailThreads, config.imageThreads, std::move(opSender), d->shutdown);

    d->funnel = std::make_unique<EventFunnel>(std::move(watchInput), std::move(opReceiver), outputSender, std::move(notify), d->shutdown);
    d->funnel->start();

    // the initial listing travels the same way as live updates
    QStringList files(resolved.files.cbegin(), resolved.files.cend());
    std::sort(files.begin(), files.end());
    for(const QString& f : files)
    {
        if(!outputSender.send(FileEvent{ FileEventKind::Added, f, QString() }))
        {
            break;
        }
    }
    qInfo() << "Discovered" << files.size() << "image(s)";
}

ImageFileService::~ImageFileService() = default;

void ImageFileService::readFile(const QString& path)
{
    d->pools->submitImage(path);
}

void ImageFileService::readThumbnail(const QString& path, int targetSize)
{
    d->pools->submitThumbnail(path, targetSize);
}

void ImageFileService::shutdown()
{
    d->shutdown.set();
}

Receiver<OutputEvent>& ImageFileService::events()
{
    return d->events;
}

std::optional<QString> ImageFileService::watchedRoot() const
{
    return d->root;
}
