#include "mainwindow.h"
#include "fileprocessor.h"
#include <QApplication>
#include <QMessageBox>
#include <QFileInfo>
#include <QCloseEvent>
#include <QFormLayout>
#include <QKeySequence>
#include <QMetaObject>
#include <QShortcut>
#include <atomic>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    // Initialize backend components
    m_configManager = std::make_unique<ConfigManager>();
    m_frameStore = std::make_shared<FrameStore>();
    m_renderer = std::make_shared<OpenCvFrameRenderer>();
    m_generator = std::make_unique<FrameGenerator>(m_frameStore, m_renderer);

    // Setup UI
    setupUI();

    m_scheduler = std::make_unique<TransmissionScheduler>(m_frameStore, m_renderer, m_canvas);

    // Load configuration
    loadConfiguration();

    // Connect signals
    connectSignals();

    updateControlButtons();

    setWindowTitle("QR Matrix Sender v1.0.0");
    resize(1280, 900);
}

MainWindow::~MainWindow()
{
    if (m_scheduler) {
        m_scheduler->abort();
    }
    if (m_generator) {
        m_generator->invalidate();
    }
}

void MainWindow::setupUI()
{
    m_centralWidget = new QWidget(this);
    setCentralWidget(m_centralWidget);

    // Main vertical layout
    QVBoxLayout* mainVerticalLayout = new QVBoxLayout(m_centralWidget);
    mainVerticalLayout->setSpacing(8);
    mainVerticalLayout->setContentsMargins(12, 12, 12, 12);

    // Control panel on the left, display canvas on the right
    m_mainLayout = new QHBoxLayout();
    m_mainLayout->setSpacing(8);

    setupControlPanel();

    m_canvas = new DisplayCanvas(m_centralWidget);
    m_mainLayout->addWidget(m_canvas, 1);

    mainVerticalLayout->addLayout(m_mainLayout, 1);

    // Setup status section (full width at bottom)
    setupStatusSection();
    mainVerticalLayout->addWidget(m_statusGroup);
}

void MainWindow::setupControlPanel()
{
    m_controlPanel = new QWidget(this);
    m_controlPanel->setFixedWidth(280);
    m_controlLayout = new QVBoxLayout(m_controlPanel);
    m_controlLayout->setSpacing(8);
    m_controlLayout->setContentsMargins(0, 0, 0, 0);

    setupFileSection();
    setupSettingsSection();
    setupControlSection();
    setupProgressSection();
    m_controlLayout->addStretch();

    m_mainLayout->addWidget(m_controlPanel);
}

void MainWindow::setupFileSection()
{
    m_fileGroup = new QGroupBox("File", m_controlPanel);
    QVBoxLayout* layout = new QVBoxLayout(m_fileGroup);
    layout->setContentsMargins(8, 6, 8, 6);
    layout->setSpacing(6);

    m_selectFileButton = new QPushButton("Select File...", m_controlPanel);
    m_fileLabel = new QLabel("No file selected", m_controlPanel);
    m_fileLabel->setWordWrap(true);

    layout->addWidget(m_selectFileButton);
    layout->addWidget(m_fileLabel);

    m_controlLayout->addWidget(m_fileGroup);
}

void MainWindow::setupSettingsSection()
{
    m_settingsGroup = new QGroupBox("Settings", m_controlPanel);
    QFormLayout* layout = new QFormLayout(m_settingsGroup);
    layout->setContentsMargins(8, 6, 8, 6);
    layout->setSpacing(6);

    m_chunkSizeCombo = new QComboBox(m_controlPanel);
    for (int size : ConfigManager::allowedChunkSizes()) {
        m_chunkSizeCombo->addItem(QString::number(size), size);
    }

    m_fpsSpinBox = new QSpinBox(m_controlPanel);
    m_fpsSpinBox->setRange(ConfigManager::MIN_FPS, ConfigManager::MAX_FPS);

    m_displayModeCombo = new QComboBox(m_controlPanel);
    m_displayModeCombo->addItem("Video (2 markers)", displayModeName(DisplayMode::Video));
    m_displayModeCombo->addItem("Photo (4 markers)", displayModeName(DisplayMode::Photo));

    m_cycleModeCombo = new QComboBox(m_controlPanel);
    m_cycleModeCombo->addItem("Continuous", cycleModeName(CycleMode::Continuous));
    m_cycleModeCombo->addItem("Single", cycleModeName(CycleMode::Single));

    m_controlFramesCheckBox = new QCheckBox("Start/stop capture frames", m_controlPanel);

    layout->addRow("Chunk size:", m_chunkSizeCombo);
    layout->addRow("FPS:", m_fpsSpinBox);
    layout->addRow("Display mode:", m_displayModeCombo);
    layout->addRow("Cycle mode:", m_cycleModeCombo);
    layout->addRow(m_controlFramesCheckBox);

    m_controlLayout->addWidget(m_settingsGroup);
}

void MainWindow::setupControlSection()
{
    m_controlGroup = new QGroupBox("Control", m_controlPanel);
    QHBoxLayout* layout = new QHBoxLayout(m_controlGroup);
    layout->setContentsMargins(8, 6, 8, 6);
    layout->setSpacing(8);

    m_startButton = new QPushButton("Start", m_controlPanel);
    m_stopButton = new QPushButton("Stop", m_controlPanel);

    layout->addWidget(m_startButton, 1);
    layout->addWidget(m_stopButton, 1);

    m_controlLayout->addWidget(m_controlGroup);
}

void MainWindow::setupProgressSection()
{
    m_progressGroup = new QGroupBox("Progress", m_controlPanel);
    QVBoxLayout* layout = new QVBoxLayout(m_progressGroup);
    layout->setContentsMargins(8, 6, 8, 6);
    layout->setSpacing(3);

    m_statusLabel = new QLabel("Idle", m_controlPanel);
    m_statusLabel->setWordWrap(true);

    m_progressBar = new QProgressBar(m_controlPanel);
    m_progressBar->setRange(0, 100);
    m_progressBar->setValue(0);
    m_progressBar->setMaximumHeight(14);
    m_progressLabel = new QLabel("0%", m_controlPanel);
    m_progressLabel->setMinimumWidth(35);

    layout->addWidget(m_statusLabel);
    QHBoxLayout* progressLayout = new QHBoxLayout();
    progressLayout->setSpacing(6);
    progressLayout->addWidget(m_progressBar);
    progressLayout->addWidget(m_progressLabel);
    layout->addLayout(progressLayout);

    m_controlLayout->addWidget(m_progressGroup);
}

void MainWindow::setupStatusSection()
{
    m_statusGroup = new QGroupBox("Status Log", m_centralWidget);
    QVBoxLayout* layout = new QVBoxLayout(m_statusGroup);
    layout->setContentsMargins(8, 6, 8, 6);
    layout->setSpacing(4);

    m_statusText = new QTextEdit(m_centralWidget);
    m_statusText->setMinimumHeight(100);
    m_statusText->setMaximumHeight(140);
    m_statusText->setReadOnly(true);

    layout->addWidget(m_statusText);
}

void MainWindow::connectSignals()
{
    connect(m_selectFileButton, &QPushButton::clicked, this, &MainWindow::onSelectFileClicked);

    // Control signals
    connect(m_startButton, &QPushButton::clicked, this, &MainWindow::onStartClicked);
    connect(m_stopButton, &QPushButton::clicked, this, &MainWindow::onStopClicked);

    // Settings that change the page layout require re-encoding the file
    connect(m_chunkSizeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::onLayoutSettingChanged);
    connect(m_displayModeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::onLayoutSettingChanged);

    connect(m_fpsSpinBox, QOverload<int>::of(&QSpinBox::valueChanged), this, &MainWindow::saveConfiguration);
    connect(m_cycleModeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::saveConfiguration);
    connect(m_controlFramesCheckBox, &QCheckBox::toggled, this, &MainWindow::saveConfiguration);

    QShortcut* escapeShortcut = new QShortcut(QKeySequence(Qt::Key_Escape), this);
    connect(escapeShortcut, &QShortcut::activated, this, &QWidget::close);
}

void MainWindow::loadConfiguration()
{
    m_config = m_configManager->loadConfig();

    m_chunkSizeCombo->setCurrentIndex(m_chunkSizeCombo->findData(m_config.chunkSize));
    m_fpsSpinBox->setValue(m_config.fps);
    m_displayModeCombo->setCurrentIndex(m_displayModeCombo->findData(displayModeName(m_config.displayMode)));
    m_cycleModeCombo->setCurrentIndex(m_cycleModeCombo->findData(cycleModeName(m_config.cycleMode)));
    m_controlFramesCheckBox->setChecked(m_config.controlFrames);
}

void MainWindow::saveConfiguration()
{
    m_config.chunkSize = m_chunkSizeCombo->currentData().toInt();
    m_config.fps = m_fpsSpinBox->value();
    m_config.displayMode = displayModeFromName(m_displayModeCombo->currentData().toString());
    m_config.cycleMode = cycleModeFromName(m_cycleModeCombo->currentData().toString());
    m_config.controlFrames = m_controlFramesCheckBox->isChecked();

    m_config = ConfigManager::validate(m_config);
    m_configManager->saveConfig(m_config);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    // The end marker is painted on the GUI thread, so wait for it without blocking
    if (m_scheduler->isRunning()) {
        m_closeRequested = true;
        m_scheduler->requestStop();
        m_statusLabel->setText("Stopping...");
        m_stopButton->setEnabled(false);
        event->ignore();
        return;
    }

    m_generator->invalidate();
    saveConfiguration();
    event->accept();
}

// Slot implementations
void MainWindow::onSelectFileClicked()
{
    QString fileName = QFileDialog::getOpenFileName(this, "Select File to Transmit", QString(),
                                                    "All Files (*)");
    if (fileName.isEmpty()) {
        return;
    }

    loadFile(fileName);
}

void MainWindow::onLayoutSettingChanged()
{
    saveConfiguration();

    // The grid and chunking are fixed per transfer, so re-encode the loaded file
    if (!m_currentFile.isEmpty()) {
        m_statusText->append("Layout settings changed, re-encoding file");
        loadFile(m_currentFile);
    }
}

bool MainWindow::loadFile(const QString& filePath)
{
    saveConfiguration();

    // Invalidate everything derived from the previous file
    m_scheduler->abort();
    m_generator->invalidate();
    m_layout.reset();
    m_framesReady = false;
    m_canvas->clear();
    updateProgress(-1);
    updateControlButtons();

    m_currentFile = filePath;
    m_fileLabel->setText(QFileInfo(filePath).fileName());

    FileProcessor processor(m_config.chunkSize, m_config.compressionLevel);
    TransferData data;
    if (!processor.processFile(filePath, data)) {
        m_statusLabel->setText("Load failed");
        m_statusText->append(QString("Error: %1").arg(processor.lastErrorString()));
        QMessageBox::warning(this, "Load Failed", processor.lastErrorString());
        return false;
    }

    const TransferHeader& header = data.header;
    m_statusText->append(QString("Loaded %1: %2, compressed %3 (%4), %5 chunks")
                         .arg(header.fileName)
                         .arg(FileProcessor::formatSize(header.originalSize))
                         .arg(FileProcessor::formatSize(header.compressedSize))
                         .arg(header.compressionType)
                         .arg(header.totalChunks));

    try {
        MarkerMode markerMode = ConfigManager::markerModeFor(m_config.displayMode);
        GridCapacity capacity = m_canvas->gridCapacity(m_config.displayMode);
        GridConfig grid = GridConfig::resolve(capacity.columns, capacity.rows, markerMode);

        m_layout = std::make_shared<const FrameLayoutEngine>(
            std::make_shared<const TransferData>(std::move(data)), grid);
    } catch (const LayoutConfigurationError& e) {
        m_statusLabel->setText("Layout error");
        m_statusText->append(QString("Layout error: %1").arg(e.what()));
        QMessageBox::warning(this, "Layout Error", e.what());
        return false;
    }

    m_statusText->append(QString("Grid %1x%2, %3 chunks per page, %4 pages")
                         .arg(m_layout->grid().columns)
                         .arg(m_layout->grid().rows)
                         .arg(m_layout->dataCapacity())
                         .arg(m_layout->totalPages()));

    startGeneration();
    return true;
}

void MainWindow::startGeneration()
{
    auto token = std::make_shared<std::atomic<quint64>>(0);

    auto progress = [this, token](double fraction, const QString& phase) {
        QMetaObject::invokeMethod(this, [this, token, fraction, phase]() {
            onGenerationProgress(token->load(), fraction, phase);
        }, Qt::QueuedConnection);
    };
    auto complete = [this, token]() {
        QMetaObject::invokeMethod(this, [this, token]() {
            onGenerationComplete(token->load());
        }, Qt::QueuedConnection);
    };
    auto failure = [this, token](const QString& error) {
        QMetaObject::invokeMethod(this, [this, token, error]() {
            onGenerationFailed(token->load(), error);
        }, Qt::QueuedConnection);
    };

    m_statusLabel->setText("Generating frames...");
    m_generationToken = m_generator->start(m_layout, progress, complete, failure);
    token->store(m_generationToken);

    if (m_generationToken == 0) {
        m_statusText->append("Frame generation already in progress");
    }
}

void MainWindow::onGenerationProgress(quint64 generation, double fraction, const QString& phase)
{
    if (generation != m_generationToken || !m_generator->isCurrent(generation)) {
        return;
    }
    m_statusLabel->setText(phase);
    updateProgress(fraction * 100.0);
}

void MainWindow::onGenerationComplete(quint64 generation)
{
    if (generation != m_generationToken || !m_generator->isCurrent(generation)) {
        return;
    }
    m_framesReady = true;
    m_statusLabel->setText("Ready to transmit");
    m_statusText->append(QString("Generated %1 frames").arg(m_frameStore->size()));
    updateControlButtons();
}

void MainWindow::onGenerationFailed(quint64 generation, const QString& error)
{
    if (generation != m_generationToken || !m_generator->isCurrent(generation)) {
        return;
    }
    m_statusLabel->setText("Frame generation failed");
    m_statusText->append(error);
    updateControlButtons();
}

void MainWindow::onStartClicked()
{
    if (!m_framesReady || !m_layout) {
        return;
    }

    saveConfiguration();
    TransmissionSettings settings = ConfigManager::transmissionSettings(m_config);

    auto progress = [this](double percentage, const QString& text) {
        QMetaObject::invokeMethod(this, [this, percentage, text]() {
            onTransmissionProgress(percentage, text);
        }, Qt::QueuedConnection);
    };
    auto finished = [this](int cycles) {
        QMetaObject::invokeMethod(this, [this, cycles]() {
            onTransmissionFinished(cycles);
        }, Qt::QueuedConnection);
    };

    if (m_scheduler->start(m_layout, settings, progress, finished)) {
        updateProgress(-1);
        m_statusLabel->setText("Transmitting");
        m_statusText->append(QString("Transmission started: %1 fps, %2 mode")
                             .arg(settings.fps)
                             .arg(cycleModeName(settings.cycleMode)));
    }
    updateControlButtons();
}

void MainWindow::onStopClicked()
{
    // Non-blocking so the end marker can still play
    m_scheduler->requestStop();
    m_statusLabel->setText("Stopping...");
    m_stopButton->setEnabled(false);
}

void MainWindow::onTransmissionProgress(double percentage, const QString& text)
{
    m_statusLabel->setText(text);
    updateProgress(percentage);
}

void MainWindow::onTransmissionFinished(int cycles)
{
    m_statusLabel->setText("Stopped");
    m_statusText->append(QString("Transmission stopped after %1 cycle(s)").arg(cycles));
    updateControlButtons();

    if (m_closeRequested) {
        close();
    }
}

void MainWindow::updateControlButtons()
{
    bool isTransmitting = m_scheduler->isRunning();

    m_startButton->setEnabled(m_framesReady && !isTransmitting);
    m_stopButton->setEnabled(isTransmitting);
    m_selectFileButton->setEnabled(!isTransmitting);
    m_chunkSizeCombo->setEnabled(!isTransmitting);
    m_displayModeCombo->setEnabled(!isTransmitting);
}

void MainWindow::updateProgress(double percentage)
{
    if (percentage >= 0) {
        int intPercentage = static_cast<int>(percentage);
        // Only update if the integer percentage has changed to prevent shaking
        if (intPercentage != m_lastProgress) {
            m_lastProgress = intPercentage;
            m_progressBar->setValue(intPercentage);
            m_progressLabel->setText(QString("%1%").arg(intPercentage));
        }
    } else {
        m_lastProgress = -1;
        m_progressBar->setValue(0);
        m_progressLabel->setText("0%");
    }
}
