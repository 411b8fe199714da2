#pragma once

#include "Channel.hpp"
#include "ShutdownFlag.hpp"
#include "types.hpp"

#include <QRunnable>
#include <QString>
#include <memory>

/**
 * Fire-and-forget decoding of one file. The result, successful or not, is posted as OperationEvent.
 * Owned and deleted by the QThreadPool which runs it.
 */
class DecodeJob : public QRunnable
{
public:
    // Maximum time a job may take before TraceTimer complains
    static constexpr int SlowDecodeMs = 3000;

    static DecodeJob* fullImage(const QString& path, Sender<OperationEvent> sink, ShutdownFlag shutdown);
    static DecodeJob* thumbnail(const QString& path, int targetSize, Sender<OperationEvent> sink, ShutdownFlag shutdown);

    ~DecodeJob() override;

    DecodeJob(const DecodeJob&) = delete;
    DecodeJob& operator=(const DecodeJob&) = delete;

    // Synchronous part of run(), never throws.
    static DecodeResult decode(OperationKind kind, const QString& path, int targetSize);

    void run() override;

private:
    DecodeJob(OperationKind kind, const QString& path, int targetSize, Sender<OperationEvent> sink, ShutdownFlag shutdown);

    struct Impl;
    std::unique_ptr<Impl> d;
};
