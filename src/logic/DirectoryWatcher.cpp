#include "DirectoryWatcher.hpp"

#include "ConstructionError.hpp"
#include "Formatter.hpp"
#include "xThreadGuard.hpp"

#include <QDir>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QFuture>
#include <QPromise>
#include <QScopedPointer>
#include <QTimer>
#include <QtDebug>

#include <algorithm>
#include <map>
#include <typeinfo>
#include <utility>

struct DirectoryWatcher::Impl
{
    DirectoryWatcher* q;
    const QString dir;
    const std::chrono::milliseconds debounce;
    Sender<RawWatchEvent> sink;

    // carries an error message, empty if the watch was set up successfully
    QScopedPointer<QPromise<QString>> setup;
    bool setupReported = false;

    // only touched by the watcher thread
    Snapshot snapshot;
    bool rootGone = false;

    Impl(DirectoryWatcher* parent, const QString& d, std::chrono::milliseconds db, Sender<RawWatchEvent> s)
        : q(parent), dir(d), debounce(db), sink(std::move(s))
    {}

    // startWatching() blocks until this has been called exactly once
    void reportSetup(const QString& error)
    {
        if(this->setupReported)
        {
            return;
        }
        this->setupReported = true;
        this->setup->start();
        this->setup->addResult(error);
        this->setup->finish();
    }

    // Returns false if the watch could not be set up, the error has been reported already then.
    bool setUp(QFileSystemWatcher& watcher, QTimer& debounceTimer)
    {
        debounceTimer.setSingleShot(true);
        debounceTimer.setInterval(this->debounce);

        QFileInfo info(this->dir);
        if(!info.isDir() || !info.isReadable())
        {
            this->reportSetup(QString("Cannot read directory '%1'").arg(this->dir));
            return false;
        }

        this->snapshot = q->takeSnapshot();

        if(!watcher.addPath(this->dir))
        {
            this->reportSetup(QString("Unable to watch directory '%1'").arg(this->dir));
            return false;
        }

        if(!this->snapshot.isEmpty())
        {
            const QStringList failed = watcher.addPaths(this->snapshot.keys());
            for(const QString& f : failed)
            {
                qWarning() << "Unable to watch file" << f << "for modifications";
            }
        }

        // the window starts with the first change and is not extended by subsequent ones
        auto arm = [&debounceTimer]()
        {
            if(!debounceTimer.isActive())
            {
                debounceTimer.start();
            }
        };
        QObject::connect(&watcher, &QFileSystemWatcher::directoryChanged, &debounceTimer, arm);
        QObject::connect(&watcher, &QFileSystemWatcher::fileChanged, &debounceTimer, arm);
        QObject::connect(&debounceTimer, &QTimer::timeout, &watcher, [this, &watcher]()
        {
            this->rescan(watcher);
        });

        this->reportSetup(QString());
        return true;
    }

    void rescan(QFileSystemWatcher& watcher)
    {
        xThreadGuard g(&watcher);

        if(!QFileInfo(this->dir).isDir())
        {
            if(!this->rootGone)
            {
                qWarning() << "Watched directory" << this->dir << "has vanished";
                this->rootGone = true;
                this->snapshot.clear();
                this->send(RawWatchEvent{ RawWatchEvent::Kind::Other, this->dir, QString() });
            }
            return;
        }

        Snapshot now = q->takeSnapshot();
        std::vector<RawWatchEvent> events = diff(this->snapshot, now);

        // QFileSystemWatcher drops deleted files on its own, hence removePath() may legitimately fail
        for(const RawWatchEvent& e : events)
        {
            switch(e.kind)
            {
            case RawWatchEvent::Kind::Remove:
                (void)watcher.removePath(e.path);
                break;
            case RawWatchEvent::Kind::Rename:
                (void)watcher.removePath(e.path);
                this->watchFile(watcher, e.newPath);
                break;
            case RawWatchEvent::Kind::Create:
                this->watchFile(watcher, e.path);
                break;
            default:
                break;
            }
        }

        this->snapshot = std::move(now);

        for(RawWatchEvent& e : events)
        {
            if(!this->send(std::move(e)))
            {
                return;
            }
        }
    }

    static void watchFile(QFileSystemWatcher& watcher, const QString& path)
    {
        if(!watcher.addPath(path))
        {
            qWarning() << "Unable to watch file" << path << "for modifications";
        }
    }

    bool send(RawWatchEvent&& e)
    {
        if(!this->sink.send(std::move(e)))
        {
            // nobody is listening anymore, no reason to keep watching
            q->quit();
            return false;
        }
        return true;
    }
};

DirectoryWatcher::DirectoryWatcher(const QString& dir, std::chrono::milliseconds debounce, Sender<RawWatchEvent> sink, QObject* parent)
    : QThread(parent), d(std::make_unique<Impl>(this, dir, debounce, std::move(sink)))
{
    this->setObjectName("Directory Watcher");
}

DirectoryWatcher::~DirectoryWatcher()
{
    this->stopWatching();
}

const QString& DirectoryWatcher::directory() const
{
    return d->dir;
}

void DirectoryWatcher::startWatching()
{
    d->setup.reset(new QPromise<QString>());
    d->setupReported = false;
    QFuture<QString> fut = d->setup->future();

    this->start();

    // blocks until run() has reported back
    QString error = fut.result();
    if(!error.isEmpty())
    {
        this->wait();
        throw ConstructionError(error.toStdString());
    }

    qInfo() << "Watching directory" << d->dir << "with a debounce window of" << d->debounce.count() << "ms";
}

void DirectoryWatcher::stopWatching()
{
    if(this->isRunning())
    {
        this->quit();
        this->wait();
    }
}

void DirectoryWatcher::run()
{
    QFileSystemWatcher watcher;
    QTimer debounceTimer;

    try
    {
        if(!d->setUp(watcher, debounceTimer))
        {
            d->sink.release();
            return;
        }
    }
    catch(const std::exception& e)
    {
        d->reportSetup(QString("Unable to watch directory '%1': %2").arg(d->dir, QString::fromStdString(e.what())));
        d->sink.release();
        return;
    }

    try
    {
        this->exec();
    }
    catch(const std::exception& e)
    {
        Formatter f;
        f << "DirectoryWatcher terminated as it caught an exception while processing event loop:\n" <<
            "Error Type: " << typeid(e).name() << "\n"
            "Error Message: \n" << e.what();
        qCritical() << f.str().c_str();
    }

    // tell the reader that there will be nothing more
    d->sink.release();
}

DirectoryWatcher::Snapshot DirectoryWatcher::takeSnapshot() const
{
    return scan(d->dir);
}

DirectoryWatcher::Snapshot DirectoryWatcher::scan(const QString& dir)
{
    Snapshot snap;
    const QFileInfoList entries = QDir(dir).entryInfoList(QDir::Files | QDir::NoDotAndDotDot | QDir::Hidden);
    for(const QFileInfo& e : entries)
    {
        snap.insert(e.absoluteFilePath(), Entry{ e.size(), e.lastModified() });
    }
    return snap;
}

std::vector<RawWatchEvent> DirectoryWatcher::diff(const Snapshot& before, const Snapshot& after)
{
    using Key = std::pair<qint64 /* size */, qint64 /* mtime */>;
    auto keyOf = [](const Entry& e)
    {
        return Key(e.size, e.lastModified.toMSecsSinceEpoch());
    };

    std::map<Key, QStringList> vanished;
    std::map<Key, QStringList> appeared;
    QStringList written;

    for(auto it = before.cbegin(); it != before.cend(); ++it)
    {
        auto other = after.constFind(it.key());
        if(other == after.cend())
        {
            vanished[keyOf(it.value())].push_back(it.key());
        }
        else if(keyOf(other.value()) != keyOf(it.value()))
        {
            written.push_back(it.key());
        }
    }

    for(auto it = after.cbegin(); it != after.cend(); ++it)
    {
        if(!before.contains(it.key()))
        {
            appeared[keyOf(it.value())].push_back(it.key());
        }
    }

    QStringList removed, created;
    std::vector<std::pair<QString, QString>> renamed;

    for(auto& [key, paths] : vanished)
    {
        auto match = appeared.find(key);
        // only pair if it is unambiguous on both sides
        if(paths.size() == 1 && match != appeared.end() && match->second.size() == 1)
        {
            renamed.emplace_back(paths.front(), match->second.front());
            appeared.erase(match);
        }
        else
        {
            removed.append(paths);
        }
    }

    for(auto& [key, paths] : appeared)
    {
        created.append(paths);
    }

    removed.sort();
    created.sort();
    written.sort();
    std::sort(renamed.begin(), renamed.end());

    std::vector<RawWatchEvent> events;
    events.reserve(removed.size() + renamed.size() + created.size() + written.size());
    for(const QString& p : removed)
    {
        events.push_back(RawWatchEvent{ RawWatchEvent::Kind::Remove, p, QString() });
    }
    for(const auto& [oldPath, newPath] : renamed)
    {
        events.push_back(RawWatchEvent{ RawWatchEvent::Kind::Rename, oldPath, newPath });
    }
    for(const QString& p : created)
    {
        events.push_back(RawWatchEvent{ RawWatchEvent::Kind::Create, p, QString() });
    }
    for(const QString& p : written)
    {
        events.push_back(RawWatchEvent{ RawWatchEvent::Kind::Write, p, QString() });
    }
    return events;
}
