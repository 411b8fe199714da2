#include "ImageCatalog.hpp"

#include <QtDebug>
#include <algorithm>

struct ImageCatalog::Impl
{
    struct Entry
    {
        QImage thumbnail;
        QImage fullImage;
        QString error;
    };

    QStringList files;
    QHash<QString, Entry> entries;
    std::optional<QString> current;

    void insertSorted(const QString& path)
    {
        auto it = std::lower_bound(this->files.begin(), this->files.end(), path);
        this->files.insert(it, path);
    }

    void onFileEvent(const FileEvent& e, Reaction& r)
    {
        switch(e.kind)
        {
        case FileEventKind::Added:
            if(this->entries.contains(e.path))
            {
                qDebug() << "Ignoring duplicate Added for" << e.path;
                return;
            }
            this->entries.insert(e.path, Entry());
            this->insertSorted(e.path);
            r.thumbnails.push_back(e.path);

            if(!this->current)
            {
                this->current = e.path;
                r.fullImages.push_back(e.path);
            }
            break;

        case FileEventKind::Removed:
            if(!this->entries.remove(e.path))
            {
                return;
            }
            this->files.removeOne(e.path);
            if(this->current == e.path)
            {
                this->current.reset();
            }
            break;

        case FileEventKind::Modified:
        {
            auto it = this->entries.find(e.path);
            if(it == this->entries.end())
            {
                return;
            }
            *it = Entry();
            r.thumbnails.push_back(e.path);
            if(this->current == e.path)
            {
                r.fullImages.push_back(e.path);
            }
            break;
        }

        case FileEventKind::Renamed:
        {
            auto it = this->entries.find(e.path);
            if(it == this->entries.end())
            {
                return;
            }
            Entry moved = std::move(*it);
            this->entries.erase(it);
            this->files.removeOne(e.path);

            if(this->entries.contains(e.newPath))
            {
                // the target was tracked already and has just been replaced
                this->files.removeOne(e.newPath);
            }
            this->entries.insert(e.newPath, std::move(moved));
            this->insertSorted(e.newPath);

            if(this->current == e.path)
            {
                this->current = e.newPath;
            }
            break;
        }
        }
    }

    void onOperationEvent(const OperationEvent& e)
    {
        auto it = this->entries.find(e.path);
        if(it == this->entries.end())
        {
            // the file has gone while it was being decoded
            return;
        }

        if(const DecodeError* err = std::get_if<DecodeError>(&e.result))
        {
            it->error = err->message;
            return;
        }

        const QImage& img = std::get<QImage>(e.result);
        it->error.clear();
        if(e.kind == OperationKind::ThumbnailLoaded)
        {
            it->thumbnail = img;
        }
        else
        {
            it->fullImage = img;
        }
    }
};

ImageCatalog::ImageCatalog() : d(std::make_unique<Impl>())
{}

ImageCatalog::~ImageCatalog() = default;

ImageCatalog::Reaction ImageCatalog::apply(const OutputEvent& e)
{
    Reaction r;
    if(const FileEvent* fe = std::get_if<FileEvent>(&e))
    {
        d->onFileEvent(*fe, r);
    }
    else
    {
        d->onOperationEvent(std::get<OperationEvent>(e));
    }
    return r;
}

const QStringList& ImageCatalog::files() const
{
    return d->files;
}

bool ImageCatalog::contains(const QString& path) const
{
    return d->entries.contains(path);
}

QImage ImageCatalog::thumbnail(const QString& path) const
{
    return d->entries.value(path).thumbnail;
}

QImage ImageCatalog::fullImage(const QString& path) const
{
    return d->entries.value(path).fullImage;
}

QString ImageCatalog::errorMessage(const QString& path) const
{
    return d->entries.value(path).error;
}

std::optional<QString> ImageCatalog::current() const
{
    return d->current;
}

std::optional<QString> ImageCatalog::select(const QString& path)
{
    auto it = d->entries.constFind(path);
    if(it == d->entries.cend())
    {
        return std::nullopt;
    }

    d->current = path;
    if(it->fullImage.isNull())
    {
        return path;
    }
    return std::nullopt;
}
