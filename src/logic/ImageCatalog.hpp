#pragma once

#include "types.hpp"

#include <QHash>
#include <QImage>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>

/**
 * Consumer side bookkeeping of the event stream: which files are known, and what has been loaded for them.
 *
 * Unknown -> Added -> Tracked -> (Modified)* -> Removed -> Unknown, Renamed moves a tracked file.
 * Events referring to paths which are not tracked are ignored.
 */
class ImageCatalog
{
public:
    // What the caller should load in response to an event.
    struct Reaction
    {
        QStringList thumbnails;
        QStringList fullImages;

        bool isEmpty() const
        {
            return thumbnails.isEmpty() && fullImages.isEmpty();
        }
    };

    ImageCatalog();
    ~ImageCatalog();

    Reaction apply(const OutputEvent& e);

    // sorted by path
    const QStringList& files() const;
    bool contains(const QString& path) const;

    QImage thumbnail(const QString& path) const;
    QImage fullImage(const QString& path) const;
    // empty if the last load for path succeeded or none has finished yet
    QString errorMessage(const QString& path) const;

    // the file shown in full size, if any
    std::optional<QString> current() const;
    // Selects path as current image. Returns the path whose full image should be loaded, if any.
    std::optional<QString> select(const QString& path);

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
