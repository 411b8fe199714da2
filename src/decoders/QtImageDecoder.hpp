#pragma once

#include "SmartImageDecoder.hpp"

/**
 * Fallback decoder for every format Qt's image plugins understand (TIFF, BMP, GIF, WebP, ...).
 */
class QtImageDecoder : public SmartImageDecoder
{
public:
    QtImageDecoder(const QString& path);
    ~QtImageDecoder() override;

    QtImageDecoder(const QtImageDecoder&) = delete;
    QtImageDecoder& operator=(const QtImageDecoder&) = delete;

    void close() override;

protected:
    void decodeHeader(const unsigned char* buffer, qint64 nbytes) override;
    QImage decodingLoop(QSize desiredResolution) override;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
