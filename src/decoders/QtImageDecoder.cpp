#include "QtImageDecoder.hpp"
#include "Formatter.hpp"

#include <QBuffer>
#include <QByteArray>
#include <QImageReader>
#include <QScopedPointer>

struct QtImageDecoder::Impl
{
    // the buffer does not own the mapped file contents, it only wraps them
    QByteArray encoded;
    QScopedPointer<QBuffer> buffer;
    QScopedPointer<QImageReader> reader;

    void reset()
    {
        this->reader.reset();
        this->buffer.reset();
        this->encoded.clear();
    }
};

QtImageDecoder::QtImageDecoder(const QString& path) : SmartImageDecoder(path), d(std::make_unique<Impl>())
{}

QtImageDecoder::~QtImageDecoder() = default;

void QtImageDecoder::decodeHeader(const unsigned char* buffer, qint64 nbytes)
{
    d->reset();
    d->encoded = QByteArray::fromRawData(reinterpret_cast<const char*>(buffer), nbytes);
    d->buffer.reset(new QBuffer(&d->encoded));
    d->buffer->open(QIODevice::ReadOnly);

    d->reader.reset(new QImageReader(d->buffer.data()));
    d->reader->setAutoTransform(false);

    if(!d->reader->canRead())
    {
        throw std::runtime_error(Formatter() << "Unsupported or corrupt image file '" << this->path() << "': " << d->reader->errorString());
    }

    QSize s = d->reader->size();
    if(!s.isValid())
    {
        // some plugins cannot tell the size without decoding, have a full look then
        QImage firstFrame = d->reader->read();
        if(firstFrame.isNull())
        {
            throw std::runtime_error(Formatter() << "Unable to decode '" << this->path() << "': " << d->reader->errorString());
        }
        s = firstFrame.size();

        // rewind for the decodingLoop()
        d->buffer->seek(0);
        d->reader.reset(new QImageReader(d->buffer.data()));
        d->reader->setAutoTransform(false);
    }

    this->setSize(s);
}

QImage QtImageDecoder::decodingLoop(QSize)
{
    QImage image = d->reader->read();
    if(image.isNull())
    {
        throw std::runtime_error(Formatter() << "Unable to decode '" << this->path() << "': " << d->reader->errorString());
    }

    this->setColorSpace(image.colorSpace());
    return image;
}

void QtImageDecoder::close()
{
    d->reset();

    SmartImageDecoder::close();
}
