#pragma once

#include <QSet>
#include <QString>
#include <QStringList>
#include <optional>

struct ResolvedPaths
{
    // exists only if every input collapses onto exactly one directory
    std::optional<QString> root;
    // canonical paths of recognized images
    QSet<QString> files;
};

class PathResolver
{
public:
    // Throws ConstructionError if a path cannot be canonicalized or a directory cannot be listed.
    static ResolvedPaths resolve(const QStringList& paths);

    // Non-recursive list of the recognized images directly inside dir.
    static QSet<QString> collectImages(const QString& dir);
};
