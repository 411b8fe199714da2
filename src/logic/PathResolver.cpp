#include "PathResolver.hpp"

#include "ConstructionError.hpp"
#include "DecoderFactory.hpp"
#include "Formatter.hpp"

#include <QDir>
#include <QFileInfo>
#include <QtDebug>

static QString canonicalize(const QString& path)
{
    QFileInfo info(path);
    QString canonical = info.canonicalFilePath();
    if(canonical.isEmpty())
    {
        throw ConstructionError(Formatter() << "Path '" << path << "' not found");
    }
    return canonical;
}

QSet<QString> PathResolver::collectImages(const QString& dir)
{
    QDir d(dir);
    if(!d.exists() || !d.isReadable())
    {
        throw ConstructionError(Formatter() << "Cannot read directory '" << dir << "'");
    }

    auto* factory = DecoderFactory::globalInstance();

    QSet<QString> files;
    const QFileInfoList entries = d.entryInfoList(QDir::Files | QDir::NoDotAndDotDot | QDir::Hidden);
    for(const QFileInfo& entry : entries)
    {
        QString canonical = canonicalize(entry.absoluteFilePath());
        if(QFileInfo(canonical).isFile() && factory->isImage(canonical))
        {
            files.insert(canonical);
        }
    }
    return files;
}

ResolvedPaths PathResolver::resolve(const QStringList& paths)
{
    ResolvedPaths result;
    if(paths.isEmpty())
    {
        return result;
    }

    auto* factory = DecoderFactory::globalInstance();

    QStringList explicitFiles;
    QSet<QString> dirs;
    for(const QString& p : paths)
    {
        QString canonical = canonicalize(p);
        QFileInfo info(canonical);
        if(info.isFile())
        {
            explicitFiles.push_back(canonical);
        }
        else if(info.isDir())
        {
            dirs.insert(canonical);
        }
        else
        {
            qDebug() << "Ignoring" << canonical << "as it is neither a file nor a directory";
        }
    }

    for(const QString& f : explicitFiles)
    {
        if(factory->isImage(f))
        {
            result.files.insert(f);
        }
    }

    for(const QString& dir : dirs)
    {
        result.files.unite(collectImages(dir));
    }

    QSet<QString> candidateRoots = dirs;
    for(const QString& f : result.files)
    {
        candidateRoots.insert(QFileInfo(f).absolutePath());
    }

    if(candidateRoots.size() == 1)
    {
        QString root = *candidateRoots.cbegin();

        // rescan, this picks up whatever appeared since the first listing
        result.files.unite(collectImages(root));
        result.root = root;
    }

    return result;
}
