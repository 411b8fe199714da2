#include "SmartImageDecoder.hpp"

#include "Formatter.hpp"
#include "xThreadGuard.hpp"

#include <QFile>
#include <QScopedPointer>
#include <QtDebug>
#include <cstdlib>
#include <stdexcept>

struct SmartImageDecoder::Impl
{
    const QString path;

    // QFile is a QObject, so it has to be created and destroyed by the decoding thread
    QScopedPointer<QFile> file;
    qint64 encodedInputBufferSize = 0;
    const unsigned char *encodedInputBufferPtr = nullptr;

    QSize size;
    QColorSpace colorSpace;

    Impl(const QString& p) : path(p)
    {}
};

SmartImageDecoder::SmartImageDecoder(const QString& path) : d(std::make_unique<Impl>(path))
{}

SmartImageDecoder::~SmartImageDecoder()
{
    this->close();
}

const QString& SmartImageDecoder::path() const
{
    return d->path;
}

QSize SmartImageDecoder::size() const
{
    return d->size;
}

void SmartImageDecoder::setSize(QSize s)
{
    d->size = s;
}

void SmartImageDecoder::setColorSpace(const QColorSpace& csp)
{
    d->colorSpace = csp;
}

void SmartImageDecoder::open()
{
    if(d->file)
    {
        throw std::logic_error(Formatter() << "Decoder for '" << d->path << "' has been opened already");
    }

    d->file.reset(new QFile(d->path));
    xThreadGuard g(d->file.data());

    if(!d->file->open(QIODevice::ReadOnly))
    {
        throw std::runtime_error(Formatter() << "Unable to open file '" << d->path << "': " << d->file->errorString());
    }

    const qint64 length = d->file->size();
    if(length <= 0)
    {
        throw std::runtime_error(Formatter() << "File '" << d->path << "' is empty");
    }

    // shared mapping, the decoders only ever read from it
    const unsigned char* mapped = d->file->map(0, length, QFileDevice::NoOptions);
    if(mapped == nullptr)
    {
        throw std::runtime_error(Formatter() << "Unable to map file '" << d->path << "' into memory: " << d->file->errorString());
    }

    d->encodedInputBufferSize = length;
    d->encodedInputBufferPtr = mapped;
}

QImage SmartImageDecoder::decode(QSize desiredResolution)
{
    if(d->encodedInputBufferPtr == nullptr)
    {
        throw std::logic_error("Decoder must be opened for decode()");
    }

    this->decodeHeader(d->encodedInputBufferPtr, d->encodedInputBufferSize);

    if(!d->size.isValid() || d->size.isEmpty())
    {
        throw std::runtime_error(Formatter() << "Image '" << d->path << "' has invalid dimensions " << d->size.width() << "x" << d->size.height());
    }

    if(desiredResolution.isValid())
    {
        // do not upscale the image while decoding
        desiredResolution = desiredResolution.boundedTo(d->size);
    }
    else
    {
        desiredResolution = d->size;
    }

    QImage img = this->decodingLoop(desiredResolution);
    this->convertColorSpace(img);
    return img;
}

void SmartImageDecoder::convertColorSpace(QImage &image)
{
    static const QColorSpace srgbSpace(QColorSpace::SRgb);

    if(d->colorSpace.isValid() && d->colorSpace != srgbSpace)
    {
        image.setColorSpace(d->colorSpace);
        image.convertToColorSpace(srgbSpace);
    }
}

void SmartImageDecoder::close()
{
    d->encodedInputBufferSize = 0;
    d->encodedInputBufferPtr = nullptr;

    if(d->file)
    {
        xThreadGuard g(d->file.data());
        d->file->close();
        d->file.reset();
    }
}

QImage SmartImageDecoder::allocateImageBuffer(uint32_t width, uint32_t height, QImage::Format format)
{
    // every decoder delivers 8 bits per channel, packed into 32 bit pixels
    switch(format)
    {
    case QImage::Format_RGB32:
    case QImage::Format_ARGB32:
    case QImage::Format_RGBX8888:
    case QImage::Format_RGBA8888:
        break;
    default:
        throw std::logic_error(Formatter() << "QImage Format '" << format << "' not supported currently");
    }

    const size_t pixels = size_t(width) * height;
    std::unique_ptr<uint32_t, decltype(&::free)> mem(static_cast<uint32_t*>(calloc(pixels, sizeof(uint32_t))), &::free);
    if(mem == nullptr)
    {
        throw std::runtime_error(Formatter() << "Unable to allocate " << (pixels * sizeof(uint32_t)) / 1024. / 1024. << " MiB for the decoded image '" << d->path << "' with dimensions " << width << "x" << height << " px");
    }

    // QImage takes over the buffer and hands it back to free() once the last copy is gone
    QImage image(reinterpret_cast<uchar*>(mem.get()), width, height, width * sizeof(uint32_t), format, &::free, mem.get());
    if(image.isNull())
    {
        throw std::runtime_error(Formatter() << "Unable to wrap the decoded buffer of '" << d->path << "' into a QImage");
    }

    mem.release();
    return image;
}
