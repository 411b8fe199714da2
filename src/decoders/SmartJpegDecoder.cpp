
#include "SmartJpegDecoder.hpp"
#include "Formatter.hpp"

#include <cstdio>
#include <string>
#include <QDebug>
#include <QColorSpace>
#include <csetjmp>

extern "C"
{
    #include <jerror.h>
    #include <jpeglib.h>
}

struct my_error_mgr
{
    struct jpeg_error_mgr pub;
    jmp_buf setjmp_buffer;
};

struct SmartJpegDecoder::Impl
{
    SmartJpegDecoder* q;

    struct jpeg_decompress_struct cinfo = {};
    struct my_error_mgr jerr;
    bool created = false;

    // last message libjpeg wanted to tell us about, used to enrich exceptions
    std::string lastMessage;

    Impl(SmartJpegDecoder* parent) : q(parent)
    {
        // We set up the normal JPEG error routines, then override error_exit.
        cinfo.err = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit = &my_error_exit;
        jerr.pub.output_message = &my_output_message;
    }

    static void my_error_exit(j_common_ptr cinfo) noexcept
    {
        /* cinfo->err really points to a my_error_mgr struct, so coerce pointer */
        auto myerr = reinterpret_cast<struct my_error_mgr*>(cinfo->err);

        (*cinfo->err->output_message) (cinfo);

        /* Return control to the setjmp point */
        longjmp(myerr->setjmp_buffer, 1);
    }

    static void my_output_message(j_common_ptr cinfo)
    {
        char buffer[JMSG_LENGTH_MAX];
        auto self = static_cast<Impl*>(cinfo->client_data);

        /* Create the message */
        (*cinfo->err->format_message) (cinfo, buffer);

        self->lastMessage = buffer;
    }

    void destroy()
    {
        if(this->created)
        {
            jpeg_destroy_decompress(&this->cinfo);
            this->created = false;
        }
    }
};

SmartJpegDecoder::SmartJpegDecoder(const QString& path) : SmartImageDecoder(path), d(std::make_unique<Impl>(this))
{}

SmartJpegDecoder::~SmartJpegDecoder()
{
    d->destroy();
}


void SmartJpegDecoder::decodeHeader(const unsigned char* buffer, qint64 nbytes)
{
    d->destroy();

    auto& cinfo = d->cinfo;
    jpeg_create_decompress(&cinfo);
    d->created = true;

    /* Tell the library to keep any APP2 data it may find */
    jpeg_save_markers(&cinfo, JPEG_APP0 + 2, 0xFFFF);

    cinfo.client_data = d.get();

    jpeg_mem_src(&cinfo, buffer, nbytes);

    // section below clobbered by setjmp()/longjmp(); declare all non-trivially destroyable types here
    std::unique_ptr<JOCTET, decltype(&::free)> icc_data(nullptr, free);
    QColorSpace iccProfile{ QColorSpace::SRgb };

    if (setjmp(d->jerr.setjmp_buffer))
    {
        // If we get here, the JPEG code has signaled an error.
        throw std::runtime_error(Formatter() << "Error while decoding the JPEG header of '" << this->path() << "': " << d->lastMessage);
    }

    int ret = jpeg_read_header(&cinfo, true);
    if(ret != JPEG_HEADER_OK)
    {
        throw std::runtime_error(Formatter() << "jpeg_read_header() failed with code " << ret << ", excpeted: " << JPEG_HEADER_OK);
    }

    JOCTET *ptr;
    unsigned int icc_len;
    if(jpeg_read_icc_profile(&cinfo, &ptr, &icc_len))
    {
        icc_data.reset(ptr);
        iccProfile = QColorSpace::fromIccProfile(QByteArray::fromRawData(reinterpret_cast<const char *>(icc_data.get()), icc_len));
    }

    cinfo.out_color_space = JCS_EXT_BGRX;

    this->setSize(QSize(cinfo.image_width, cinfo.image_height));
    this->setColorSpace(iccProfile);
}

QImage SmartJpegDecoder::decodingLoop(QSize desiredResolution)
{
    auto& cinfo = d->cinfo;

    // the entire jpeg() section below is clobbered by setjmp/longjmp
    // hence, declare any objects with nontrivial destructors here
    QImage image;

    if (setjmp(d->jerr.setjmp_buffer))
    {
        // If we get here, the JPEG code has signaled an error.
        throw std::runtime_error(Formatter() << "Error while decoding the JPEG image '" << this->path() << "': " << d->lastMessage);
    }

    static_assert(sizeof(JSAMPLE) == sizeof(uint8_t), "JSAMPLE is not 8bits, which is unsupported");

    // set parameters for decompression
    cinfo.dct_method = JDCT_ISLOW;
    cinfo.do_fancy_upsampling = true;
    cinfo.do_block_smoothing = false;

    // libjpeg shrinks by 1/2, 1/4 or 1/8 for free while decoding;
    // pick the smallest output that still covers the desired resolution
    unsigned denom = 8;
    while(denom > 1 && (cinfo.image_width / denom < static_cast<unsigned>(desiredResolution.width()) || cinfo.image_height / denom < static_cast<unsigned>(desiredResolution.height())))
    {
        denom /= 2;
    }
    cinfo.scale_num = 1;
    cinfo.scale_denom = denom;

    // Used to set up image size so arrays can be allocated
    jpeg_calc_output_dimensions(&cinfo);

    if (jpeg_start_decompress(&cinfo) == false)
    {
        qWarning() << "I/O suspension after jpeg_start_decompress()";
    }

    switch(cinfo.output_components)
    {
        case 1:
        case 3:
        case 4:
            break;
        default:
            throw std::runtime_error(Formatter() << "Unsupported number of pixel color components: " << cinfo.output_components);
    }

    image = this->allocateImageBuffer(cinfo.output_width, cinfo.output_height, QImage::Format_RGB32);

    while (cinfo.output_scanline < cinfo.output_height)
    {
        JSAMPROW row = const_cast<JSAMPLE*>(image.constScanLine(cinfo.output_scanline));
        jpeg_read_scanlines(&cinfo, &row, 1);
    }

    jpeg_finish_decompress(&cinfo);

    if(denom != 1)
    {
        qDebug() << "Decoded" << this->path() << "at 1/" << denom << "scale:" << image.size();
    }

    return image;
}

void SmartJpegDecoder::close()
{
    d->destroy();

    SmartImageDecoder::close();
}
