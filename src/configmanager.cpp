#include "configmanager.h"
#include <QDebug>
#include <algorithm>

// Configuration keys
const QString ConfigManager::KEY_CHUNK_SIZE = "chunkSize";
const QString ConfigManager::KEY_FPS = "fps";
const QString ConfigManager::KEY_DISPLAY_MODE = "displayMode";
const QString ConfigManager::KEY_CYCLE_MODE = "cycleMode";
const QString ConfigManager::KEY_HEADER_SECONDS = "headerSeconds";
const QString ConfigManager::KEY_PAGE_SECONDS = "pageSeconds";
const QString ConfigManager::KEY_CONTROL_FRAMES = "controlFrames";
const QString ConfigManager::KEY_CONTROL_SECONDS = "controlSeconds";
const QString ConfigManager::KEY_COMPRESSION_LEVEL = "compressionLevel";

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings("QRMatrixSender", "QRMatrixSender", this);
}

ConfigManager::ConfigManager(const QString& iniFilePath, QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings(iniFilePath, QSettings::IniFormat, this);
}

AppConfig ConfigManager::loadConfig()
{
    AppConfig config;

    config.chunkSize = m_settings->value(KEY_CHUNK_SIZE, config.chunkSize).toInt();
    config.fps = m_settings->value(KEY_FPS, config.fps).toInt();

    QString displayName = m_settings->value(KEY_DISPLAY_MODE, displayModeName(config.displayMode)).toString();
    config.displayMode = displayModeFromName(displayName);

    QString cycleName = m_settings->value(KEY_CYCLE_MODE, cycleModeName(config.cycleMode)).toString();
    config.cycleMode = cycleModeFromName(cycleName);

    // Dwell settings
    config.headerSeconds = m_settings->value(KEY_HEADER_SECONDS, config.headerSeconds).toInt();
    config.pageSeconds = m_settings->value(KEY_PAGE_SECONDS, config.pageSeconds).toInt();
    config.controlFrames = m_settings->value(KEY_CONTROL_FRAMES, config.controlFrames).toBool();
    config.controlSeconds = m_settings->value(KEY_CONTROL_SECONDS, config.controlSeconds).toInt();

    config.compressionLevel = m_settings->value(KEY_COMPRESSION_LEVEL, config.compressionLevel).toInt();

    return validate(config);
}

void ConfigManager::saveConfig(const AppConfig& config)
{
    const AppConfig valid = validate(config);

    m_settings->setValue(KEY_CHUNK_SIZE, valid.chunkSize);
    m_settings->setValue(KEY_FPS, valid.fps);
    m_settings->setValue(KEY_DISPLAY_MODE, displayModeName(valid.displayMode));
    m_settings->setValue(KEY_CYCLE_MODE, cycleModeName(valid.cycleMode));

    // Dwell settings
    m_settings->setValue(KEY_HEADER_SECONDS, valid.headerSeconds);
    m_settings->setValue(KEY_PAGE_SECONDS, valid.pageSeconds);
    m_settings->setValue(KEY_CONTROL_FRAMES, valid.controlFrames);
    m_settings->setValue(KEY_CONTROL_SECONDS, valid.controlSeconds);

    m_settings->setValue(KEY_COMPRESSION_LEVEL, valid.compressionLevel);

    m_settings->sync();
}

AppConfig ConfigManager::validate(const AppConfig& config)
{
    AppConfig result = config;
    const AppConfig defaults;

    if (!allowedChunkSizes().contains(result.chunkSize)) {
        qWarning() << "ConfigManager: unsupported chunk size" << result.chunkSize
                   << "- using" << defaults.chunkSize;
        result.chunkSize = defaults.chunkSize;
    }

    result.fps = std::clamp(result.fps, MIN_FPS, MAX_FPS);
    result.headerSeconds = std::clamp(result.headerSeconds, MIN_DWELL_SECONDS, MAX_DWELL_SECONDS);
    result.pageSeconds = std::clamp(result.pageSeconds, MIN_DWELL_SECONDS, MAX_DWELL_SECONDS);
    result.controlSeconds = std::clamp(result.controlSeconds, MIN_DWELL_SECONDS, MAX_DWELL_SECONDS);
    result.compressionLevel = std::clamp(result.compressionLevel, MIN_COMPRESSION_LEVEL, MAX_COMPRESSION_LEVEL);

    return result;
}

QList<int> ConfigManager::allowedChunkSizes()
{
    return {300, 500, 600, 800, 1000};
}

TransmissionSettings ConfigManager::transmissionSettings(const AppConfig& config)
{
    const AppConfig valid = validate(config);

    TransmissionSettings settings;
    settings.fps = valid.fps;
    settings.headerSeconds = valid.headerSeconds;
    settings.pageSeconds = valid.pageSeconds;
    settings.controlSeconds = valid.controlSeconds;
    settings.cycleMode = valid.cycleMode;
    settings.startMarker = valid.controlFrames;
    settings.endMarker = valid.controlFrames;
    return settings;
}

MarkerMode ConfigManager::markerModeFor(DisplayMode mode)
{
    switch (mode) {
        case DisplayMode::Photo:
            return MarkerMode::FourCorner;
        case DisplayMode::Video:
        default:
            return MarkerMode::TwoCorner;
    }
}
