#include "types.hpp"

const char* toString(FileEventKind kind)
{
    switch(kind)
    {
    case FileEventKind::Added:
        return "added";
    case FileEventKind::Removed:
        return "removed";
    case FileEventKind::Modified:
        return "modified";
    case FileEventKind::Renamed:
        return "renamed";
    }
    return "unknown";
}

const char* toString(OperationKind kind)
{
    switch(kind)
    {
    case OperationKind::ThumbnailLoaded:
        return "thumbnail";
    case OperationKind::ImageLoaded:
        return "image";
    }
    return "unknown";
}
