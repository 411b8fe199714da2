#include "DecoderFactory.hpp"
#include "Formatter.hpp"
#include "ConstructionError.hpp"
#include "ImageCatalog.hpp"
#include "ImageFileService.hpp"
#include "Settings.hpp"
#include "types.hpp"

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QSet>
#include <QTextStream>
#include <QtDebug>

#include <memory>
#include <typeinfo>

static void print(const QString& line)
{
    static QTextStream out(stdout);
    out << line << Qt::endl;
}

static QString describe(const QImage& img)
{
    return QString("%1x%2").arg(img.width()).arg(img.height());
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("IMView");
    app.setApplicationName("IMView");

    // create and init DecoderFactory in main thread
    (void)DecoderFactory::globalInstance();

    Settings settings;

    QCommandLineParser parser;
    parser.setApplicationDescription("Lists images, loads their thumbnails and follows changes of the directory they live in.");
    parser.addHelpOption();
    QCommandLineOption thumbnailSizeOption("thumbnail-size", "Edge length of the thumbnail box in pixels.", "N", QString::number(settings.thumbnailSize()));
    QCommandLineOption oneshotOption("oneshot", "Quit once every initially discovered image has a thumbnail.");
    parser.addOption(thumbnailSizeOption);
    parser.addOption(oneshotOption);
    parser.addPositionalArgument("path", "Image files or directories.", "<path>...");
    parser.process(app);

    bool ok = false;
    const int thumbnailSize = parser.value(thumbnailSizeOption).toInt(&ok);
    if(!ok || thumbnailSize <= 0)
    {
        qCritical() << "Invalid thumbnail size" << parser.value(thumbnailSizeOption);
        return 1;
    }

    const QStringList paths = parser.positionalArguments();
    if(paths.isEmpty())
    {
        parser.showHelp(1);
    }

    const bool oneshot = parser.isSet(oneshotOption);

    ImageCatalog catalog;
    std::unique_ptr<ImageFileService> service;
    QSet<QString> pendingThumbnails;

    auto handle = [&](const OutputEvent& e)
    {
        if(const FileEvent* fe = std::get_if<FileEvent>(&e))
        {
            if(fe->kind == FileEventKind::Renamed)
            {
                print(QString("%1 %2 -> %3").arg(QString(toString(fe->kind)), fe->path, fe->newPath));
            }
            else
            {
                print(QString("%1 %2").arg(QString(toString(fe->kind)), fe->path));
            }
        }
        else
        {
            const OperationEvent& op = std::get<OperationEvent>(e);
            if(const DecodeError* err = std::get_if<DecodeError>(&op.result))
            {
                print(QString("error %1: %2").arg(op.path, err->message));
            }
            else
            {
                print(QString("%1 %2 %3").arg(QString(toString(op.kind)), describe(std::get<QImage>(op.result)), op.path));
            }

            if(op.kind == OperationKind::ThumbnailLoaded)
            {
                pendingThumbnails.remove(op.path);
            }
        }

        ImageCatalog::Reaction r = catalog.apply(e);
        for(const QString& p : r.thumbnails)
        {
            service->readThumbnail(p, thumbnailSize);
        }
        for(const QString& p : r.fullImages)
        {
            service->readFile(p);
        }
    };

    auto drain = [&]()
    {
        OutputEvent e;
        ChannelStatus status;
        while((status = service->events().tryRecv(e)) == ChannelStatus::Ok)
        {
            handle(e);
        }

        if(status == ChannelStatus::Disconnected)
        {
            qWarning() << "Event stream has ended";
            app.quit();
        }
        else if(oneshot && pendingThumbnails.isEmpty())
        {
            app.quit();
        }
    };

    // called from the event funnel's thread, hence only post the drain into the main loop
    auto notify = [&app, &drain]()
    {
        QMetaObject::invokeMethod(&app, drain, Qt::QueuedConnection);
    };

    try
    {
        service = std::make_unique<ImageFileService>(paths, notify, settings.serviceConfig());
    }
    catch(const ConstructionError& e)
    {
        qCritical() << e.what();
        return 1;
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&]()
    {
        service->shutdown();
    });

    int r = -1;
    try
    {
        // the initial listing has been queued before the constructor returned
        OutputEvent e;
        while(service->events().tryRecv(e) == ChannelStatus::Ok)
        {
            if(const FileEvent* fe = std::get_if<FileEvent>(&e))
            {
                pendingThumbnails.insert(fe->path);
            }
            handle(e);
        }

        if(oneshot && pendingThumbnails.isEmpty())
        {
            r = 0;
        }
        else
        {
            r = app.exec();
        }
    }
    catch(const std::exception& e)
    {
        Formatter f;
        f << "An unexpected error caused IMView to terminate.\n"
            "Error Type: " << typeid(e).name() << "\n"
            "Error Message: \n" << e.what();
        qCritical() << f.str().c_str();
    }

    // the funnel keeps calling notify until it is joined, so tear the service down while drain is still alive
    service->shutdown();
    service.reset();
    return r;
}
