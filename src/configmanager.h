#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include <QList>
#include "transferdata.h"
#include "transmissionstate.h"

struct AppConfig {
    int chunkSize;
    int fps;
    DisplayMode displayMode;
    CycleMode cycleMode;

    // Dwell settings (seconds)
    int headerSeconds;
    int pageSeconds;
    bool controlFrames;
    int controlSeconds;

    int compressionLevel;

    // Default values
    AppConfig() :
        chunkSize(800),
        fps(5),
        displayMode(DisplayMode::Video),
        cycleMode(CycleMode::Continuous),
        headerSeconds(3),
        pageSeconds(1),
        controlFrames(true),
        controlSeconds(2),
        compressionLevel(3)
    {}
};

class ConfigManager : public QObject
{
    Q_OBJECT

public:
    explicit ConfigManager(QObject *parent = nullptr);

    /**
     * Use an INI file instead of the platform settings store
     * @param iniFilePath Path of the INI file
     */
    explicit ConfigManager(const QString& iniFilePath, QObject *parent = nullptr);

    /**
     * Load configuration from persistent storage
     * @return Validated AppConfig structure with loaded settings
     */
    AppConfig loadConfig();

    /**
     * Save configuration to persistent storage
     * @param config Configuration to save (validated before writing)
     */
    void saveConfig(const AppConfig& config);

    /**
     * Bring every field into its accepted range
     * @param config Configuration from the UI or from storage
     * @return Configuration safe to hand to the transmission core
     */
    static AppConfig validate(const AppConfig& config);

    /**
     * Chunk sizes offered by the UI
     */
    static QList<int> allowedChunkSizes();

    /**
     * Scheduler settings derived from the configuration
     */
    static TransmissionSettings transmissionSettings(const AppConfig& config);

    /**
     * Marker layout used for a display mode (Video: 2 corners, Photo: 4 corners)
     */
    static MarkerMode markerModeFor(DisplayMode mode);

    static constexpr int MIN_FPS = 3;
    static constexpr int MAX_FPS = 10;
    static constexpr int MIN_DWELL_SECONDS = 1;
    static constexpr int MAX_DWELL_SECONDS = 30;
    static constexpr int MIN_COMPRESSION_LEVEL = 1;
    static constexpr int MAX_COMPRESSION_LEVEL = 19;

private:
    QSettings* m_settings;

    // Configuration keys
    static const QString KEY_CHUNK_SIZE;
    static const QString KEY_FPS;
    static const QString KEY_DISPLAY_MODE;
    static const QString KEY_CYCLE_MODE;
    static const QString KEY_HEADER_SECONDS;
    static const QString KEY_PAGE_SECONDS;
    static const QString KEY_CONTROL_FRAMES;
    static const QString KEY_CONTROL_SECONDS;
    static const QString KEY_COMPRESSION_LEVEL;
};

#endif // CONFIGMANAGER_H
