#pragma once

#include "Channel.hpp"
#include "types.hpp"

#include <QDateTime>
#include <QHash>
#include <QThread>
#include <QString>
#include <chrono>
#include <memory>
#include <vector>

/**
 * Debounced, non-recursive watch of a single directory.
 *
 * Runs its own thread with an event loop. Any change notification for the directory or one of the files
 * directly inside it arms a single-shot timer; when it fires, the directory is rescanned and the difference
 * to the previous scan is pushed into the sink as RawWatchEvents.
 * The sink is released when the thread ends, which is how readers learn that the watch is over.
 */
class DirectoryWatcher : public QThread
{
    Q_OBJECT

public:
    struct Entry
    {
        qint64 size = -1;
        QDateTime lastModified;
    };
    using Snapshot = QHash<QString /* canonical file path */, Entry>;

    DirectoryWatcher(const QString& dir, std::chrono::milliseconds debounce, Sender<RawWatchEvent> sink, QObject* parent = nullptr);
    ~DirectoryWatcher() override;

    // Starts the thread and waits until the watch is in place. Throws ConstructionError if it could not be set up.
    void startWatching();

    // Quits the event loop and waits for the thread to finish.
    void stopWatching();

    const QString& directory() const;

    static Snapshot scan(const QString& dir);
    // Computes the events which turn `before` into `after`, in the order Remove, Rename, Create, Write.
    static std::vector<RawWatchEvent> diff(const Snapshot& before, const Snapshot& after);

protected:
    void run() override;
    // Called on the watcher thread for the initial scan and every rescan.
    virtual Snapshot takeSnapshot() const;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
