#pragma once

#include <QColorSpace>
#include <QImage>
#include <QSize>
#include <QString>
#include <cstdint>
#include <memory>

/**
 * Base class for image decoders. Not a QObject and may therefore be owned by any thread.
 * A decoder serves exactly one file. open(), decode() and close() must be called by the same thread.
 */
class SmartImageDecoder
{
public:
    SmartImageDecoder(const QString& path);
    virtual ~SmartImageDecoder();

    SmartImageDecoder(const SmartImageDecoder&) = delete;
    SmartImageDecoder& operator=(const SmartImageDecoder&) = delete;

    const QString& path() const;

    // dimensions of the full image, available after decodeHeader()
    QSize size() const;

    // virtual for the purpose of unit testing
    virtual void open();

    // Decodes the image. An invalid desiredResolution requests the full resolution, a valid one
    // allows the decoder to return anything at least that large (it never upscales).
    virtual QImage decode(QSize desiredResolution = QSize());
    virtual void close();

protected:
    virtual void decodeHeader(const unsigned char* buffer, qint64 nbytes) = 0;
    virtual QImage decodingLoop(QSize desiredResolution) = 0;

    void setSize(QSize);
    void setColorSpace(const QColorSpace&);
    void convertColorSpace(QImage& image);

    QImage allocateImageBuffer(uint32_t width, uint32_t height, QImage::Format format);

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
