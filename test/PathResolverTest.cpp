#include "PathResolverTest.hpp"
#include "PathResolver.hpp"
#include "ConstructionError.hpp"
#include "TestHelpers.hpp"

#include <QTest>
#include <QTemporaryDir>

QTEST_GUILESS_MAIN(PathResolverTest)

void PathResolverTest::emptyInput()
{
    ResolvedPaths r = PathResolver::resolve({});
    QVERIFY(!r.root.has_value());
    QVERIFY(r.files.isEmpty());
}

void PathResolverTest::singleDirectoryBecomesRoot()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    QDir dir(tmp.path());
    QString a = writeImage(dir, "a.png", 10, 10);
    QString b = writeImage(dir, "b.png", 10, 10);

    ResolvedPaths r = PathResolver::resolve({ tmp.path() });
    QVERIFY(r.root.has_value());
    QCOMPARE(*r.root, QFileInfo(tmp.path()).canonicalFilePath());
    QCOMPARE(r.files, QSet<QString>({ a, b }));
}

void PathResolverTest::explicitFilesShareTheirParent()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    QDir dir(tmp.path());
    QString a = writeImage(dir, "a.png", 10, 10);
    QString b = writeImage(dir, "b.png", 10, 10);
    QString c = writeImage(dir, "c.png", 10, 10);

    // the parent is rescanned once it turns out to be the only candidate
    ResolvedPaths r = PathResolver::resolve({ a, dir.absoluteFilePath("./b.png") });
    QVERIFY(r.root.has_value());
    QCOMPARE(*r.root, QFileInfo(tmp.path()).canonicalFilePath());
    QCOMPARE(r.files, QSet<QString>({ a, b, c }));
}

void PathResolverTest::twoDirectoriesDisableWatch()
{
    QTemporaryDir tmp1, tmp2;
    QVERIFY(tmp1.isValid() && tmp2.isValid());
    QString a = writeImage(QDir(tmp1.path()), "a.png", 10, 10);
    QString b = writeImage(QDir(tmp2.path()), "b.png", 10, 10);

    ResolvedPaths r = PathResolver::resolve({ tmp1.path(), tmp2.path() });
    QVERIFY(!r.root.has_value());
    QCOMPARE(r.files, QSet<QString>({ a, b }));

    // a file from elsewhere makes a second candidate as well
    r = PathResolver::resolve({ tmp1.path(), b });
    QVERIFY(!r.root.has_value());
    QCOMPARE(r.files, QSet<QString>({ a, b }));
}

void PathResolverTest::nonImageFilesAreFiltered()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    QDir dir(tmp.path());
    QString a = writeImage(dir, "a.png", 10, 10);
    QVERIFY(writeText(dir, "notes.txt", "hello"));
    QVERIFY(writeText(dir, "noextension", "hello"));

    ResolvedPaths r = PathResolver::resolve({ tmp.path() });
    QCOMPARE(r.files, QSet<QString>({ a }));

    // an explicitly given non-image is dropped without complaint
    r = PathResolver::resolve({ dir.absoluteFilePath("notes.txt") });
    QVERIFY(r.files.isEmpty());
    QVERIFY(!r.root.has_value());
}

void PathResolverTest::missingPathThrows()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    QVERIFY_EXCEPTION_THROWN(PathResolver::resolve({ tmp.filePath("does-not-exist") }), ConstructionError);
    QVERIFY_EXCEPTION_THROWN(PathResolver::collectImages(tmp.filePath("does-not-exist")), ConstructionError);
}

void PathResolverTest::subdirectoriesAreNotEntered()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    QDir dir(tmp.path());
    QVERIFY(dir.mkdir("sub"));
    writeImage(QDir(dir.absoluteFilePath("sub")), "deep.png", 10, 10);
    QString a = writeImage(dir, "a.png", 10, 10);

    QCOMPARE(PathResolver::collectImages(tmp.path()), QSet<QString>({ a }));
}
