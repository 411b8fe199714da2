#include "Settings.hpp"

#include <QThread>
#include <algorithm>

int ServiceConfig::defaultThreadCount()
{
    return std::max(1, std::min(QThread::idealThreadCount(), MaxDefaultThreads));
}

static int positiveOr(const QVariant& v, int fallback)
{
    bool ok = false;
    int i = v.toInt(&ok);
    return (ok && i > 0) ? i : fallback;
}

Settings::Settings() :  QSettings (QSettings::IniFormat, QSettings::UserScope, "IMView", "IMView")
{
}

Settings::Settings(const QString& iniFile) : QSettings(iniFile, QSettings::IniFormat)
{
}

Settings::~Settings() = default;

ServiceConfig Settings::serviceConfig()
{
    ServiceConfig cfg;
    cfg.thumbnailThreads = positiveOr(this->value("Workers/thumbnailThreads"), cfg.thumbnailThreads);
    cfg.imageThreads = positiveOr(this->value("Workers/imageThreads"), cfg.imageThreads);
    cfg.debounce = std::chrono::milliseconds(positiveOr(this->value("Watch/debounceMs"), static_cast<int>(cfg.debounce.count())));
    return cfg;
}

void Settings::setServiceConfig(const ServiceConfig& cfg)
{
    this->setValue("Workers/thumbnailThreads", cfg.thumbnailThreads);
    this->setValue("Workers/imageThreads", cfg.imageThreads);
    this->setValue("Watch/debounceMs", static_cast<qlonglong>(cfg.debounce.count()));
}

int Settings::thumbnailSize()
{
    return positiveOr(this->value("Thumbnails/size"), DefaultThumbnailSize);
}

void Settings::setThumbnailSize(int px)
{
    this->setValue("Thumbnails/size", px);
}
