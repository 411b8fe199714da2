#pragma once

#include <QImage>
#include <QString>

#include <variant>

// Raw notification as delivered by the directory watcher, not yet classified.
struct RawWatchEvent
{
    enum class Kind
    {
        Create,
        Write,
        Remove,
        Rename,
        Other,
    };

    Kind kind = Kind::Other;
    QString path;
    // only set for Rename
    QString newPath;
};

enum class FileEventKind
{
    Added,
    Removed,
    Modified,
    Renamed,
};

struct FileEvent
{
    FileEventKind kind;
    QString path;
    // target path of a Renamed event, empty otherwise
    QString newPath;

    bool operator==(const FileEvent& other) const
    {
        return kind == other.kind && path == other.path && newPath == other.newPath;
    }
};

struct DecodeError
{
    QString message;
};

using DecodeResult = std::variant<QImage, DecodeError>;

enum class OperationKind
{
    ThumbnailLoaded,
    ImageLoaded,
};

struct OperationEvent
{
    OperationKind kind;
    QString path;
    DecodeResult result;

    bool hasError() const
    {
        return std::holds_alternative<DecodeError>(result);
    }
};

// The only item type delivered to the consumer.
using OutputEvent = std::variant<FileEvent, OperationEvent>;

const char* toString(FileEventKind kind);
const char* toString(OperationKind kind);
