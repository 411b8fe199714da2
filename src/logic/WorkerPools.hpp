#pragma once

#include "Channel.hpp"
#include "ShutdownFlag.hpp"
#include "types.hpp"

#include <QString>
#include <memory>

class QThreadPool;

/**
 * Two independently sized thread pools, so thumbnail generation cannot starve full image loads or vice versa.
 * Submissions never block and are not deduplicated.
 */
class WorkerPools
{
public:
    WorkerPools(int thumbnailThreads, int imageThreads, Sender<OperationEvent> sink, ShutdownFlag shutdown);
    ~WorkerPools();

    WorkerPools(const WorkerPools&) = delete;
    WorkerPools& operator=(const WorkerPools&) = delete;

    void submitThumbnail(const QString& path, int targetSize);
    void submitImage(const QString& path);

    QThreadPool* thumbnailPool();
    QThreadPool* imagePool();

    // Waits for all queued jobs and gives up this object's handle on the completion channel.
    // Afterwards, no further jobs are accepted.
    void finish();

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
