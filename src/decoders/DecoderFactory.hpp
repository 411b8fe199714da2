#pragma once

#include <QImage>
#include <QSet>
#include <QSize>
#include <QString>
#include <memory>

class SmartImageDecoder;

class DecoderFactory
{
public:
    // create the instance in the main thread before any worker asks for it
    static DecoderFactory* globalInstance();

    // Scales img proportionally so that it fits into a targetSize x targetSize box.
    // Both dimensions are floored and never drop below one pixel.
    static QImage resizeToFit(const QImage& img, int targetSize);
    static QSize sizeToFit(const QSize& size, int targetSize);

    ~DecoderFactory();

    // Format recognition by file extension only, the file is not touched.
    bool isImage(const QString& path) const;

    std::unique_ptr<SmartImageDecoder> getDecoder(const QString& path);

    // Opens, decodes and closes path. Throws std::runtime_error on any failure.
    QImage decode(const QString& path, QSize desiredResolution = QSize());

    // Like decode() followed by resizeToFit(), but lets the decoder skip detail the thumbnail won't show.
    // The box is always computed from the full image dimensions.
    QImage decodeThumbnail(const QString& path, int targetSize);

private:
    DecoderFactory();

    QSet<QString> supportedSuffixes;
};
