#include "SettingsTest.hpp"
#include "Settings.hpp"

#include <QTest>
#include <QTemporaryDir>

#include <chrono>

using namespace std::chrono_literals;

QTEST_GUILESS_MAIN(SettingsTest)

void SettingsTest::defaults()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    Settings s(tmp.filePath("imview.ini"));

    ServiceConfig cfg = s.serviceConfig();
    QVERIFY(cfg.thumbnailThreads >= 1 && cfg.thumbnailThreads <= ServiceConfig::MaxDefaultThreads);
    QCOMPARE(cfg.imageThreads, cfg.thumbnailThreads);
    QCOMPARE(cfg.debounce, ServiceConfig::DefaultDebounce);
    QCOMPARE(s.thumbnailSize(), Settings::DefaultThumbnailSize);
}

void SettingsTest::roundTrip()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString ini = tmp.filePath("imview.ini");

    {
        Settings s(ini);
        ServiceConfig cfg;
        cfg.thumbnailThreads = 3;
        cfg.imageThreads = 1;
        cfg.debounce = 250ms;
        s.setServiceConfig(cfg);
        s.setThumbnailSize(96);
    }

    Settings s(ini);
    ServiceConfig cfg = s.serviceConfig();
    QCOMPARE(cfg.thumbnailThreads, 3);
    QCOMPARE(cfg.imageThreads, 1);
    QCOMPARE(cfg.debounce, 250ms);
    QCOMPARE(s.thumbnailSize(), 96);
}

void SettingsTest::nonPositiveValuesFallBack()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    Settings s(tmp.filePath("imview.ini"));
    s.setValue("Workers/thumbnailThreads", 0);
    s.setValue("Workers/imageThreads", "many");
    s.setValue("Watch/debounceMs", -5);
    s.setThumbnailSize(-1);

    ServiceConfig cfg = s.serviceConfig();
    QCOMPARE(cfg.thumbnailThreads, ServiceConfig::defaultThreadCount());
    QCOMPARE(cfg.imageThreads, ServiceConfig::defaultThreadCount());
    QCOMPARE(cfg.debounce, ServiceConfig::DefaultDebounce);
    QCOMPARE(s.thumbnailSize(), Settings::DefaultThumbnailSize);
}
