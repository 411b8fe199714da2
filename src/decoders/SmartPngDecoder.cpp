
#include "SmartPngDecoder.hpp"
#include "Formatter.hpp"

#include <vector>
#include <cstring>
#include <string>
#include <QDebug>
#include <QColorSpace>
#include <csetjmp>

#include <png.h>

#ifndef PNG_SETJMP_SUPPORTED
#error "libpng must be compiled with SETJMP support!"
#endif

struct SmartPngDecoder::Impl
{
    SmartPngDecoder* q;

    png_structp cinfo = nullptr;
    png_infop info_ptr = nullptr;
    png_infop einfo_ptr = nullptr;

    const unsigned char* inputBufferBegin = nullptr;
    qint64 inputBufferLength = 0;
    const unsigned char* inputBufferPtr = nullptr;

    // last message libpng wanted to tell us about, used to enrich exceptions
    std::string lastMessage;

    Impl(SmartPngDecoder* parent) : q(parent)
    {
    }

    size_t inputBufferRemaining()
    {
        return (uintptr_t)(this->inputBufferBegin + this->inputBufferLength) - (uintptr_t)this->inputBufferPtr;
    }

    static void my_read_fn(png_structp png_ptr, png_bytep data, size_t len)
    {
        auto* self = static_cast<SmartPngDecoder::Impl*>(png_get_io_ptr(png_ptr));

        size_t remaining = self->inputBufferRemaining();
        if (remaining < len)
        {
            png_error(png_ptr, "Attempted to read beyond end of file");
        }

        std::memcpy(data, self->inputBufferPtr, len);
        self->inputBufferPtr += len;
    }

    static void my_error_exit(png_structp png_ptr, png_const_charp message) noexcept
    {
        my_output_message(png_ptr, message);

        // returning is fine, libpng longjmp()s to the active setjmp() point afterwards
    }

    static void my_output_message(png_structp png_ptr, png_const_charp message)
    {
        auto* self = static_cast<SmartPngDecoder::Impl*>(png_get_error_ptr(png_ptr));

        self->lastMessage = message;
    }

    void destroy()
    {
        if(this->cinfo != nullptr)
        {
            png_destroy_read_struct(&this->cinfo, &this->info_ptr, &this->einfo_ptr);
        }
        this->cinfo = nullptr;
        this->info_ptr = this->einfo_ptr = nullptr;
    }
};

SmartPngDecoder::SmartPngDecoder(const QString& path) : SmartImageDecoder(path), d(std::make_unique<Impl>(this))
{}

SmartPngDecoder::~SmartPngDecoder()
{
    d->destroy();
}

void SmartPngDecoder::decodeHeader(const unsigned char* buffer, qint64 nbytes)
{
    d->destroy();

    d->inputBufferBegin = d->inputBufferPtr = buffer;
    d->inputBufferLength = nbytes;

    auto& cinfo = d->cinfo;

    cinfo = png_create_read_struct(PNG_LIBPNG_VER_STRING, NULL, NULL, NULL);
    if (cinfo == nullptr)
    {
        throw std::bad_alloc();
    }

    png_set_error_fn(cinfo, d.get(), SmartPngDecoder::Impl::my_error_exit, SmartPngDecoder::Impl::my_output_message);
    png_set_read_fn(cinfo, d.get(), SmartPngDecoder::Impl::my_read_fn);

    d->info_ptr = png_create_info_struct(cinfo);
    d->einfo_ptr = png_create_info_struct(cinfo);

    if (d->info_ptr == nullptr || d->einfo_ptr == nullptr)
    {
        throw std::bad_alloc();
    }

    // SECTION BELOW CLOBBERED BY setjmp() / longjmp()!
    // Declare all non-trivially destructable objects here.
    QColorSpace iccProfile{ QColorSpace::SRgb };
    if (setjmp(png_jmpbuf(cinfo)))
    {
        // If we get here, libpng has signaled an error.
        throw std::runtime_error(Formatter() << "Error while decoding the PNG header of '" << this->path() << "': " << d->lastMessage);
    }

    png_read_info(cinfo, d->info_ptr);

    uint32_t width, height;
    int bit_depth, color_type, interlace_type, compression_type, filter_type;
    png_get_IHDR(cinfo, d->info_ptr, &width, &height, &bit_depth, &color_type, &interlace_type, &compression_type, &filter_type);

    if (color_type == PNG_COLOR_TYPE_PALETTE)
    {
        png_set_palette_to_rgb(cinfo);
    }

    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8)
    {
        png_set_expand_gray_1_2_4_to_8(cinfo);
    }

    if (png_get_valid(cinfo, d->info_ptr, PNG_INFO_tRNS))
    {
        png_set_tRNS_to_alpha(cinfo);
    }

    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA)
    {
        png_set_gray_to_rgb(cinfo);
    }

    if (color_type == PNG_COLOR_TYPE_RGB || color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_PALETTE)
    {
        png_set_filler(cinfo, 0xff, PNG_FILLER_AFTER);
    }

    // thumbnails and previews do not benefit from 16 bit precision
    if (bit_depth == 16)
    {
        png_set_strip_16(cinfo);
    }

    switch (interlace_type)
    {
    case PNG_INTERLACE_NONE:
    case PNG_INTERLACE_ADAM7:
        break;
    default:
        throw std::runtime_error(Formatter() << "Unsupported interlace type: " << interlace_type);
    }

    png_charp name;
    png_bytep profile;
    png_uint_32 proflen;
    if (png_get_iCCP(cinfo, d->info_ptr, &name, &compression_type, &profile, &proflen) != 0)
    {
        iccProfile = QColorSpace::fromIccProfile(QByteArray(reinterpret_cast<char*>(profile), proflen));
    }

    this->setSize(QSize(width, height));
    this->setColorSpace(iccProfile);
}


// PNG has no cheap way of decoding at reduced resolution, the full image is always returned
QImage SmartPngDecoder::decodingLoop(QSize)
{
    auto& cinfo = d->cinfo;

    auto width = png_get_image_width(cinfo, d->info_ptr);
    auto height = png_get_image_height(cinfo, d->info_ptr);

    QImage image = this->allocateImageBuffer(width, height, QImage::Format_RGBA8888);

    // libpng writes straight into the rows of the QImage
    std::vector<png_bytep> rows(height);
    for (png_uint_32 y = 0; y < height; y++)
    {
        rows[y] = image.scanLine(y);
    }

    // the entire section below is clobbered by setjmp/longjmp
    // hence, declare any objects with nontrivial destructors here
    if (setjmp(png_jmpbuf(cinfo)))
    {
        throw std::runtime_error(Formatter() << "Error while decoding the PNG image '" << this->path() << "': " << d->lastMessage);
    }

    int numPasses = 1;
    int interlace_type = png_get_interlace_type(cinfo, d->info_ptr);
    if (interlace_type == PNG_INTERLACE_ADAM7)
    {
        numPasses = png_set_interlace_handling(cinfo);
    }

    png_read_update_info(cinfo, d->info_ptr);

    for (int pass = 0; pass < numPasses; pass++)
    {
        png_read_rows(cinfo, rows.data(), nullptr, height);
    }

    return image;
}

void SmartPngDecoder::close()
{
    d->destroy();

    SmartImageDecoder::close();
}
