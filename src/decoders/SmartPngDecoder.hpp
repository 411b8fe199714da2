#pragma once

#include "SmartImageDecoder.hpp"


class SmartPngDecoder : public SmartImageDecoder
{
public:
    SmartPngDecoder(const QString& path);
    ~SmartPngDecoder() override;

    SmartPngDecoder(const SmartPngDecoder&) = delete;
    SmartPngDecoder& operator=(const SmartPngDecoder&) = delete;

    void close() override;

protected:
    void decodeHeader(const unsigned char* buffer, qint64 nbytes) override;
    QImage decodingLoop(QSize desiredResolution) override;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};
