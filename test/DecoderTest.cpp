#include "DecoderTest.hpp"
#include "DecoderFactory.hpp"
#include "SmartImageDecoder.hpp"
#include "SmartJpegDecoder.hpp"
#include "SmartPngDecoder.hpp"
#include "QtImageDecoder.hpp"
#include "TestHelpers.hpp"

#include <QTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QTemporaryFile>

#include <stdexcept>

QTEST_GUILESS_MAIN(DecoderTest)

constexpr const char errHeader[] = "Some header decode error";
constexpr const char errDec[]    = "Some decoding decode error";


class ImageDecoderUnderTest : public SmartImageDecoder
{
    friend class DecoderTest;
    bool decodeHeaderFail = false;
    bool decodingLoopFail = false;
public:
    void setDecodeHeaderFail(bool b)
    {
        this->decodeHeaderFail = b;
    }

    void setDecodingLoopFail(bool b)
    {
        this->decodingLoopFail = b;
    }

    ImageDecoderUnderTest(const QString& path) : SmartImageDecoder(path)
    {}

protected:
    void decodeHeader(const unsigned char*, qint64) override
    {
        if(this->decodeHeaderFail)
            throw std::runtime_error(errHeader);

        this->setSize(QSize(64, 32));
    }

    QImage decodingLoop(QSize desiredResolution) override
    {
        if(this->decodingLoopFail)
            throw std::runtime_error(errDec);

        return QImage(desiredResolution, QImage::Format_ARGB32);
    }
};

void DecoderTest::initTestCase()
{
    // create and init DecoderFactory in main thread
    QVERIFY(DecoderFactory::globalInstance() != nullptr);
}

void DecoderTest::errorWhileOpeningFile()
{
    ImageDecoderUnderTest dec("IdON0tEx1st.jpg");
    QVERIFY_EXCEPTION_THROWN(dec.open(), std::runtime_error);
    dec.close();

    QVERIFY_EXCEPTION_THROWN(DecoderFactory::globalInstance()->decode("IdON0tEx1st.jpg"), std::runtime_error);
}

void DecoderTest::decodeRequiresOpen()
{
    ImageDecoderUnderTest dec("IdON0tEx1st.jpg");
    QVERIFY_EXCEPTION_THROWN(dec.decode(), std::logic_error);
}

void DecoderTest::errorsOfSubclassesPropagate()
{
    QTemporaryFile jpg("imviewtestfile-XXXXXX.jpg");
    QVERIFY(jpg.open());
    QVERIFY(jpg.putChar('\0'));
    QVERIFY(jpg.flush());

    ImageDecoderUnderTest dec(jpg.fileName());
    dec.open();
    QImage img = dec.decode();
    QCOMPARE(img.size(), QSize(64, 32));
    // never upscaled
    QCOMPARE(dec.decode(QSize(640, 320)).size(), QSize(64, 32));
    QCOMPARE(dec.decode(QSize(16, 8)).size(), QSize(16, 8));
    dec.close();

    dec.setDecodeHeaderFail(true);
    dec.open();
    try
    {
        dec.decode();
        QFAIL("decode() should have thrown");
    }
    catch(const std::runtime_error& e)
    {
        QCOMPARE(QString(e.what()), QString(errHeader));
    }
    dec.close();

    dec.setDecodeHeaderFail(false);
    dec.setDecodingLoopFail(true);
    dec.open();
    try
    {
        dec.decode();
        QFAIL("decode() should have thrown");
    }
    catch(const std::runtime_error& e)
    {
        QCOMPARE(QString(e.what()), QString(errDec));
    }
    dec.close();
}

void DecoderTest::recognizesImagesByExtension()
{
    auto* fac = DecoderFactory::globalInstance();
    QVERIFY(fac->isImage("/some/where/a.jpg"));
    QVERIFY(fac->isImage("/some/where/a.JPEG"));
    QVERIFY(fac->isImage("b.png"));
    QVERIFY(!fac->isImage("notes.txt"));
    QVERIFY(!fac->isImage("README"));
    QVERIFY(!fac->isImage("/some/where.jpg/file"));

    QVERIFY(dynamic_cast<SmartJpegDecoder*>(fac->getDecoder("x.jpg").get()) != nullptr);
    QVERIFY(dynamic_cast<SmartPngDecoder*>(fac->getDecoder("x.PNG").get()) != nullptr);
    QVERIFY(dynamic_cast<QtImageDecoder*>(fac->getDecoder("x.bmp").get()) != nullptr);
}

void DecoderTest::sizeToFit_data()
{
    QTest::addColumn<QSize>("source");
    QTest::addColumn<int>("target");
    QTest::addColumn<QSize>("expected");

    QTest::newRow("landscape") << QSize(400, 300) << 150 << QSize(150, 112);
    QTest::newRow("portrait") << QSize(300, 400) << 150 << QSize(112, 150);
    QTest::newRow("square") << QSize(1000, 1000) << 150 << QSize(150, 150);
    QTest::newRow("upscale") << QSize(40, 30) << 150 << QSize(150, 112);
    QTest::newRow("thin strip") << QSize(10000, 10) << 150 << QSize(150, 1);
}

void DecoderTest::sizeToFit()
{
    QFETCH(QSize, source);
    QFETCH(int, target);
    QFETCH(QSize, expected);

    QCOMPARE(DecoderFactory::sizeToFit(source, target), expected);
}

void DecoderTest::sizeToFitRejectsNonsense()
{
    QVERIFY_EXCEPTION_THROWN(DecoderFactory::sizeToFit(QSize(0, 10), 150), std::invalid_argument);
    QVERIFY_EXCEPTION_THROWN(DecoderFactory::sizeToFit(QSize(10, 10), 0), std::invalid_argument);
    QVERIFY_EXCEPTION_THROWN(DecoderFactory::resizeToFit(QImage(), 150), std::invalid_argument);
}

void DecoderTest::decodePng()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString png = writeImage(QDir(dir.path()), "a.png", 400, 300);
    QVERIFY(!png.isEmpty());

    QImage img = DecoderFactory::globalInstance()->decode(png);
    QCOMPARE(img.size(), QSize(400, 300));
    QCOMPARE(QColor(img.pixel(10, 10)), QColor(200, 40, 90));

    QImage thumb = DecoderFactory::resizeToFit(img, 150);
    QCOMPARE(thumb.size(), QSize(150, 112));
}

void DecoderTest::sixteenBitPngIsStripped()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    QImage deep(64, 48, QImage::Format_RGBA64);
    deep.fill(QColor(200, 40, 90));
    const QString path = dir.filePath("deep.png");
    QVERIFY(deep.save(path));

    QImage img = DecoderFactory::globalInstance()->decode(path);
    QCOMPARE(img.size(), QSize(64, 48));
    QCOMPARE(img.format(), QImage::Format_RGBA8888);
    QCOMPARE(img.pixelColor(5, 5), QColor(200, 40, 90));
}

void DecoderTest::emptyFileThrows()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeText(QDir(dir.path()), "empty.png", QByteArray()));

    auto dec = DecoderFactory::globalInstance()->getDecoder(dir.filePath("empty.png"));
    QVERIFY_EXCEPTION_THROWN(dec->open(), std::runtime_error);
    dec->close();
    QVERIFY_EXCEPTION_THROWN(dec->decode(), std::logic_error);
}

void DecoderTest::decodeJpegAtReducedResolution()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString jpg = writeImage(QDir(dir.path()), "a.jpg", 400, 300);
    if(jpg.isEmpty())
    {
        QSKIP("Qt was built without JPEG writer");
    }

    auto* fac = DecoderFactory::globalInstance();
    QCOMPARE(fac->decode(jpg).size(), QSize(400, 300));

    // 1/2 is the smallest scale which still covers the box
    QImage reduced = fac->decode(jpg, QSize(150, 150));
    QCOMPARE(reduced.size(), QSize(200, 150));
    QCOMPARE(DecoderFactory::resizeToFit(reduced, 150).size(), QSize(150, 112));
}

void DecoderTest::thumbnailFitsFullDimensions_data()
{
    QTest::addColumn<QString>("name");
    QTest::addColumn<QSize>("source");
    QTest::addColumn<int>("target");
    QTest::addColumn<QSize>("expected");

    // libjpeg rounds the prescaled 1/8 size up to 200x151, which must not leak into the result
    QTest::newRow("jpeg odd height") << QString("odd.jpg") << QSize(1600, 1201) << 150 << QSize(150, 112);
    QTest::newRow("jpeg even") << QString("even.jpg") << QSize(400, 300) << 150 << QSize(150, 112);
    QTest::newRow("jpeg portrait") << QString("tall.jpg") << QSize(1203, 1601) << 150 << QSize(112, 150);
    QTest::newRow("jpeg smaller than box") << QString("small.jpg") << QSize(40, 30) << 150 << QSize(150, 112);
    QTest::newRow("png odd height") << QString("odd.png") << QSize(1600, 1201) << 150 << QSize(150, 112);
}

void DecoderTest::thumbnailFitsFullDimensions()
{
    QFETCH(QString, name);
    QFETCH(QSize, source);
    QFETCH(int, target);
    QFETCH(QSize, expected);

    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString path = writeImage(QDir(dir.path()), name, source.width(), source.height());
    if(path.isEmpty())
    {
        QSKIP("Qt was built without a writer for this format");
    }

    auto* fac = DecoderFactory::globalInstance();
    QImage thumb = fac->decodeThumbnail(path, target);
    QCOMPARE(thumb.size(), expected);
    QCOMPARE(thumb.size(), DecoderFactory::resizeToFit(fac->decode(path), target).size());

    QVERIFY_EXCEPTION_THROWN(fac->decodeThumbnail(path, 0), std::invalid_argument);
}

void DecoderTest::corruptJpegThrows()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeText(QDir(dir.path()), "broken.jpg", QByteArray("this is not a jpeg at all")));

    QVERIFY_EXCEPTION_THROWN(DecoderFactory::globalInstance()->decode(dir.filePath("broken.jpg")), std::runtime_error);
}

void DecoderTest::fallbackDecoderForOtherFormats()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString bmp = writeImage(QDir(dir.path()), "a.bmp", 40, 30);
    QVERIFY(!bmp.isEmpty());

    QImage img = DecoderFactory::globalInstance()->decode(bmp);
    QCOMPARE(img.size(), QSize(40, 30));

    QVERIFY(writeText(QDir(dir.path()), "broken.bmp", QByteArray("BMnope")));
    QVERIFY_EXCEPTION_THROWN(DecoderFactory::globalInstance()->decode(dir.filePath("broken.bmp")), std::runtime_error);
}
