#include "CliTest.hpp"
#include "TestHelpers.hpp"

#include <QTest>
#include <QProcess>
#include <QProcessEnvironment>
#include <QRegularExpression>
#include <QTemporaryDir>

QTEST_GUILESS_MAIN(CliTest)

#ifndef IMVIEW_EXECUTABLE
#error "IMVIEW_EXECUTABLE must point to the imview binary"
#endif

static constexpr int ProcessTimeoutMs = 60000;

static void runImview(QProcess& p, const QStringList& args, const QString& configDir)
{
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    // keep the user's settings out of it
    env.insert("XDG_CONFIG_HOME", configDir);
    p.setProcessEnvironment(env);
    p.start(IMVIEW_EXECUTABLE, args);
}

void CliTest::oneshotQuitsWhileImagesAreStillLoading()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    QDir dir(tmp.path());
    QVERIFY(dir.mkdir("images"));
    QDir images(dir.absoluteFilePath("images"));

    constexpr int N = 6;
    for(int i = 0; i < N; i++)
    {
        // large enough that the full image of the current file is still decoding when the last thumbnail arrives
        QVERIFY(!writeImage(images, QString("img%1.png").arg(i), 3000, 2000).isEmpty());
    }
    QVERIFY(writeText(images, "notes.txt", "not an image"));

    QProcess p;
    runImview(p, { "--oneshot", "--thumbnail-size", "30", images.absolutePath() }, dir.absoluteFilePath("config"));
    QVERIFY(p.waitForStarted());
    QVERIFY(p.waitForFinished(ProcessTimeoutMs));

    QCOMPARE(p.exitStatus(), QProcess::NormalExit);
    QCOMPARE(p.exitCode(), 0);

    const QString out = QString::fromLocal8Bit(p.readAllStandardOutput());
    const QStringList lines = out.split('\n', Qt::SkipEmptyParts);
    QCOMPARE(lines.filter(QRegularExpression("^added ")).size(), N);
    QCOMPARE(lines.filter(QRegularExpression("^thumbnail 30x20 ")).size(), N);
    QVERIFY(!out.contains("notes.txt"));
    QVERIFY(!out.contains("error"));
}

void CliTest::missingPathExitsWithError()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());

    QProcess p;
    runImview(p, { "--oneshot", tmp.filePath("does-not-exist") }, tmp.filePath("config"));
    QVERIFY(p.waitForFinished(ProcessTimeoutMs));
    QCOMPARE(p.exitStatus(), QProcess::NormalExit);
    QCOMPARE(p.exitCode(), 1);
    QVERIFY(QString::fromLocal8Bit(p.readAllStandardError()).contains("not found"));
}

void CliTest::invalidThumbnailSizeExitsWithError()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());

    QProcess p;
    runImview(p, { "--thumbnail-size", "zero", tmp.path() }, tmp.filePath("config"));
    QVERIFY(p.waitForFinished(ProcessTimeoutMs));
    QCOMPARE(p.exitStatus(), QProcess::NormalExit);
    QCOMPARE(p.exitCode(), 1);
}
