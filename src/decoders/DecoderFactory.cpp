#include "DecoderFactory.hpp"

#include "SmartImageDecoder.hpp"
#include "SmartJpegDecoder.hpp"
#include "SmartPngDecoder.hpp"
#include "QtImageDecoder.hpp"
#include "Formatter.hpp"

#include <QFileInfo>
#include <QImageReader>
#include <QDebug>

#include <algorithm>
#include <stdexcept>
#include <cmath>


DecoderFactory::DecoderFactory()
{
    this->supportedSuffixes = { "jpg", "jpeg", "jpe", "png" };

    const QList<QByteArray> formats = QImageReader::supportedImageFormats();
    for(const QByteArray& f : formats)
    {
        this->supportedSuffixes.insert(QString::fromLatin1(f).toLower());
    }

    qDebug() << "Recognized image file extensions:" << this->supportedSuffixes.values();
}

DecoderFactory::~DecoderFactory() = default;

DecoderFactory *DecoderFactory::globalInstance()
{
    static DecoderFactory fac;
    return &fac;
}

bool DecoderFactory::isImage(const QString& path) const
{
    QString suffix = QFileInfo(path).suffix().toLower();
    return !suffix.isEmpty() && this->supportedSuffixes.contains(suffix);
}

std::unique_ptr<SmartImageDecoder> DecoderFactory::getDecoder(const QString& path)
{
    QString format = QFileInfo(path).suffix().toLower();

    if(format == "jpeg" || format == "jpg" || format == "jpe")
    {
        return std::make_unique<SmartJpegDecoder>(path);
    }
    else if(format == "png")
    {
        return std::make_unique<SmartPngDecoder>(path);
    }

    // if that didn't work, let Qt determine the type by looking into the file
    return std::make_unique<QtImageDecoder>(path);
}

QImage DecoderFactory::decode(const QString& path, QSize desiredResolution)
{
    std::unique_ptr<SmartImageDecoder> dec = this->getDecoder(path);

    dec->open();
    QImage img = dec->decode(desiredResolution);
    dec->close();

    return img;
}

QImage DecoderFactory::decodeThumbnail(const QString& path, int targetSize)
{
    if(targetSize <= 0)
    {
        throw std::invalid_argument(Formatter() << "Thumbnail size must be positive, got " << targetSize);
    }

    std::unique_ptr<SmartImageDecoder> dec = this->getDecoder(path);

    dec->open();
    QImage img = dec->decode(QSize(targetSize, targetSize));
    dec->close();

    // the decoder may have prescaled with its own rounding, hence fit the header dimensions
    QSize target = sizeToFit(dec->size(), targetSize);
    if(target == img.size())
    {
        return img;
    }
    return img.scaled(target, Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
}

QSize DecoderFactory::sizeToFit(const QSize& size, int targetSize)
{
    if(size.isEmpty() || targetSize <= 0)
    {
        throw std::invalid_argument(Formatter() << "Cannot fit an image of " << size.width() << "x" << size.height() << " px into a box of " << targetSize << " px");
    }

    const double ws = static_cast<double>(targetSize) / size.width();
    const double hs = static_cast<double>(targetSize) / size.height();
    const double s = std::min(ws, hs);

    int w = static_cast<int>(std::floor(size.width() * s));
    int h = static_cast<int>(std::floor(size.height() * s));

    return QSize(std::max(w, 1), std::max(h, 1));
}

QImage DecoderFactory::resizeToFit(const QImage& img, int targetSize)
{
    QSize target = sizeToFit(img.size(), targetSize);
    if(target == img.size())
    {
        return img;
    }

    return img.scaled(target, Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
}
