#pragma once

#include <QColor>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QString>
#include <QtGlobal>

#include <atomic>

// Writes a w x h test image, the format is derived from the file extension.
inline QString writeImage(const QDir& dir, const QString& name, int w, int h)
{
    QImage img(w, h, QImage::Format_RGB32);
    img.fill(QColor(200, 40, 90));
    QString path = dir.absoluteFilePath(name);
    if(!img.save(path))
    {
        return QString();
    }
    return QFileInfo(path).canonicalFilePath();
}

inline bool writeText(const QDir& dir, const QString& name, const QByteArray& content)
{
    QFile f(dir.absoluteFilePath(name));
    if(!f.open(QIODevice::WriteOnly))
    {
        return false;
    }
    return f.write(content) == content.size();
}

// Counts qCritical() messages while installed, everything is passed on to the previous handler.
class CriticalLogCounter
{
public:
    CriticalLogCounter()
    {
        count().store(0);
        previous() = qInstallMessageHandler(&CriticalLogCounter::handler);
    }

    ~CriticalLogCounter()
    {
        qInstallMessageHandler(previous());
    }

    int criticals() const
    {
        return count().load();
    }

private:
    static std::atomic<int>& count()
    {
        static std::atomic<int> c{ 0 };
        return c;
    }

    static QtMessageHandler& previous()
    {
        static QtMessageHandler p = nullptr;
        return p;
    }

    static void handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
    {
        if(type == QtCriticalMsg)
        {
            ++count();
        }
        if(previous())
        {
            previous()(type, ctx, msg);
        }
    }
};
