#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QGroupBox>
#include <QPushButton>
#include <QLabel>
#include <QSpinBox>
#include <QComboBox>
#include <QCheckBox>
#include <QProgressBar>
#include <QTextEdit>
#include <QFileDialog>
#include <memory>

#include "configmanager.h"
#include "displaycanvas.h"
#include "framegenerator.h"
#include "framelayout.h"
#include "framerenderer.h"
#include "framestore.h"
#include "transmissionscheduler.h"

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(QWidget *parent = nullptr);
    ~MainWindow();

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onSelectFileClicked();
    void onStartClicked();
    void onStopClicked();
    void onLayoutSettingChanged();

    // Worker notifications, delivered on the GUI thread
    void onGenerationProgress(quint64 generation, double fraction, const QString& phase);
    void onGenerationComplete(quint64 generation);
    void onGenerationFailed(quint64 generation, const QString& error);
    void onTransmissionProgress(double percentage, const QString& text);
    void onTransmissionFinished(int cycles);

private:
    void setupUI();
    void setupControlPanel();
    void setupFileSection();
    void setupSettingsSection();
    void setupControlSection();
    void setupProgressSection();
    void setupStatusSection();

    void loadConfiguration();
    void saveConfiguration();
    void updateControlButtons();
    void updateProgress(double percentage);
    void connectSignals();

    /**
     * Stop playback, drop the previous transfer, then encode and lay out a file
     * @param filePath File to transmit
     * @return true if frame generation was started
     */
    bool loadFile(const QString& filePath);

    void startGeneration();

    // UI Components
    QWidget* m_centralWidget;
    QHBoxLayout* m_mainLayout;

    // Control Panel
    QWidget* m_controlPanel;
    QVBoxLayout* m_controlLayout;

    // File Section
    QGroupBox* m_fileGroup;
    QPushButton* m_selectFileButton;
    QLabel* m_fileLabel;

    // Settings Section
    QGroupBox* m_settingsGroup;
    QComboBox* m_chunkSizeCombo;
    QSpinBox* m_fpsSpinBox;
    QComboBox* m_displayModeCombo;
    QComboBox* m_cycleModeCombo;
    QCheckBox* m_controlFramesCheckBox;

    // Control Section
    QGroupBox* m_controlGroup;
    QPushButton* m_startButton;
    QPushButton* m_stopButton;

    // Progress Section
    QGroupBox* m_progressGroup;
    QLabel* m_statusLabel;
    QProgressBar* m_progressBar;
    QLabel* m_progressLabel;

    // Status Section
    QGroupBox* m_statusGroup;
    QTextEdit* m_statusText;

    DisplayCanvas* m_canvas;

    // Backend components
    std::unique_ptr<ConfigManager> m_configManager;
    AppConfig m_config;

    std::shared_ptr<FrameStore> m_frameStore;
    std::shared_ptr<const FrameRenderer> m_renderer;
    std::unique_ptr<FrameGenerator> m_generator;
    std::unique_ptr<TransmissionScheduler> m_scheduler;
    std::shared_ptr<const FrameLayoutEngine> m_layout;

    QString m_currentFile;
    quint64 m_generationToken = 0;
    bool m_framesReady = false;
    bool m_closeRequested = false;

    // Progress tracking to prevent shaking
    int m_lastProgress = -1;
};

#endif // MAINWINDOW_H
