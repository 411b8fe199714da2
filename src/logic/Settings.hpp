#pragma once

#include "ServiceConfig.hpp"

#include <QSettings>
#include <QString>

class Settings : public QSettings
{
public:
    static constexpr int DefaultThumbnailSize = 150/*px*/;

    Settings();
    // for tests and custom locations
    Settings(const QString& iniFile);
    ~Settings() override;

    ServiceConfig serviceConfig();
    void setServiceConfig(const ServiceConfig& cfg);

    int thumbnailSize();
    void setThumbnailSize(int px);
};
