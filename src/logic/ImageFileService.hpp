#pragma once

#include "Channel.hpp"
#include "ServiceConfig.hpp"
#include "types.hpp"

#include <QString>
#include <QStringList>
#include <functional>
#include <memory>
#include <optional>

/**
 * Discovers the images among a set of input paths, optionally watches their common directory and decodes
 * full images and thumbnails in the background.
 *
 * Every state change, the initial listing included, is delivered through the single event stream returned by
 * events(). The notify hook is called from the funnel's thread once per forwarded event; it must be thread-safe
 * and should only wake up whoever drains the stream.
 */
class ImageFileService
{
public:
    // Throws ConstructionError if a path does not exist, a directory can't be read or the watch can't be set up.
    ImageFileService(const QStringList& paths, std::function<void()> notify, const ServiceConfig& config = ServiceConfig());
    ~ImageFileService();

    ImageFileService(const ImageFileService&) = delete;
    ImageFileService& operator=(const ImageFileService&) = delete;

    // Both are fire-and-forget: the result arrives as OperationEvent on the event stream.
    void readFile(const QString& path);
    void readThumbnail(const QString& path, int targetSize);

    // Marks the upcoming teardown as intended. Nothing is stopped or joined here.
    void shutdown();

    Receiver<OutputEvent>& events();

    std::optional<QString> watchedRoot() const;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
