#pragma once

#include <QObject>

class DecoderTest : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void errorWhileOpeningFile();
    void decodeRequiresOpen();
    void errorsOfSubclassesPropagate();
    void recognizesImagesByExtension();
    void sizeToFit_data();
    void sizeToFit();
    void sizeToFitRejectsNonsense();
    void decodePng();
    void sixteenBitPngIsStripped();
    void emptyFileThrows();
    void decodeJpegAtReducedResolution();
    void thumbnailFitsFullDimensions_data();
    void thumbnailFitsFullDimensions();
    void corruptJpegThrows();
    void fallbackDecoderForOtherFormats();
};
