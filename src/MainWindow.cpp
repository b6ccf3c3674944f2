#include "MainWindow.h"

#include <QFileDialog>
#include <QFont>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QProgressBar>
#include <QPushButton>
#include <QTextEdit>
#include <QVBoxLayout>

#include <string>

#include "JobRunner.h"
#include "Logging.h"

namespace {

const char* const kStyleSheet = R"(
    QMainWindow {
        background-color: #2E2E2E;
    }
    QLabel {
        color: #FFFFFF;
        font-size: 12px;
    }
    QLineEdit {
        background-color: #404040;
        color: #FFFFFF;
        border: 1px solid #606060;
        border-radius: 4px;
        padding: 5px;
    }
    QPushButton {
        background-color: #505050;
        color: #FFFFFF;
        border: none;
        border-radius: 4px;
        padding: 8px 15px;
        min-width: 80px;
    }
    QPushButton:hover {
        background-color: #606060;
    }
    QPushButton:disabled {
        background-color: #3A3A3A;
        color: #808080;
    }
    QTextEdit {
        background-color: #404040;
        color: #FFFFFF;
        border: 1px solid #606060;
        border-radius: 4px;
        font-family: monospace;
    }
    QProgressBar {
        background-color: #404040;
        color: #FFFFFF;
        border: 1px solid #606060;
        border-radius: 4px;
        text-align: center;
    }
    QProgressBar::chunk {
        background-color: #4CAF50;
        width: 10px;
    }
)";

}  // namespace

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
    setWindowTitle(tr("Silence Cutter"));
    setGeometry(100, 100, 600, 400);
    setupStyle();
    setupUi();

    // The runner lives on the worker thread and is deleted with it.
    m_runner = new JobRunner;
    m_runner->moveToThread(&m_workerThread);
    connect(&m_workerThread, &QThread::finished, m_runner, &QObject::deleteLater);
    connect(this, &MainWindow::startRequested, m_runner, &JobRunner::run, Qt::QueuedConnection);
    connect(m_runner, &JobRunner::logMessage, this, &MainWindow::onLogMessage,
            Qt::QueuedConnection);
    connect(m_runner, &JobRunner::progressChanged, m_progress, &QProgressBar::setValue,
            Qt::QueuedConnection);
    connect(m_runner, &JobRunner::finished, this, &MainWindow::onFinished, Qt::QueuedConnection);
    m_workerThread.start();
}

MainWindow::~MainWindow() {
    // A running job is not cancellable; quitting waits for it to end.
    m_workerThread.quit();
    m_workerThread.wait();
}

void MainWindow::setupStyle() {
    setStyleSheet(QString::fromLatin1(kStyleSheet));

    QFont font = this->font();
    font.setPointSize(9);
    setFont(font);
}

void MainWindow::setupUi() {
    auto* central = new QWidget(this);
    setCentralWidget(central);
    auto* mainLayout = new QVBoxLayout(central);
    mainLayout->setContentsMargins(15, 15, 15, 15);
    mainLayout->setSpacing(15);

    mainLayout->addLayout(createFileSection());
    mainLayout->addLayout(createSettingsSection());

    m_progress = new QProgressBar;
    m_progress->setRange(0, 100);
    m_progress->setValue(0);
    mainLayout->addWidget(m_progress);

    m_log = new QTextEdit;
    m_log->setReadOnly(true);
    m_log->setPlaceholderText(tr("Processing log..."));
    mainLayout->addWidget(m_log);

    auto* buttonLayout = new QHBoxLayout;
    m_startButton = new QPushButton(tr("Process Video"));
    m_startButton->setStyleSheet(QStringLiteral("background-color: #2196F3;"));
    connect(m_startButton, &QPushButton::clicked, this, &MainWindow::startProcessing);
    buttonLayout->addWidget(m_startButton);
    mainLayout->addLayout(buttonLayout);
}

QLayout* MainWindow::createFileSection() {
    auto* layout = new QVBoxLayout;
    layout->setSpacing(10);

    auto* inputLayout = new QHBoxLayout;
    m_inputPath = new QLineEdit;
    m_inputPath->setPlaceholderText(tr("Select the input video..."));
    auto* browseInput = new QPushButton(tr("Browse"));
    connect(browseInput, &QPushButton::clicked, this, &MainWindow::browseInput);
    inputLayout->addWidget(m_inputPath);
    inputLayout->addWidget(browseInput);

    auto* outputLayout = new QHBoxLayout;
    m_outputPath = new QLineEdit;
    m_outputPath->setPlaceholderText(tr("Select where to save the result..."));
    auto* browseOutput = new QPushButton(tr("Browse"));
    connect(browseOutput, &QPushButton::clicked, this, &MainWindow::browseOutput);
    outputLayout->addWidget(m_outputPath);
    outputLayout->addWidget(browseOutput);

    layout->addWidget(new QLabel(tr("Input video:")));
    layout->addLayout(inputLayout);
    layout->addWidget(new QLabel(tr("Output location:")));
    layout->addLayout(outputLayout);
    return layout;
}

QLayout* MainWindow::createSettingsSection() {
    auto* layout = new QHBoxLayout;
    layout->setSpacing(15);

    m_threshold = new QLineEdit(QString::number(ProcessingConfig::kDefaultThresholdDb));
    m_minSilence = new QLineEdit(QString::number(ProcessingConfig::kDefaultMinSilenceMs));

    auto* thresholdLayout = new QVBoxLayout;
    thresholdLayout->addWidget(new QLabel(tr("Silence threshold (dB):")));
    thresholdLayout->addWidget(m_threshold);

    auto* silenceLayout = new QVBoxLayout;
    silenceLayout->addWidget(new QLabel(tr("Minimum silence (ms):")));
    silenceLayout->addWidget(m_minSilence);

    layout->addLayout(thresholdLayout);
    layout->addLayout(silenceLayout);
    return layout;
}

void MainWindow::browseInput() {
    QString file = QFileDialog::getOpenFileName(this, tr("Select Video"), QString(),
                                                tr("Videos (*.mp4 *.avi *.mov *.mkv)"));
    if (!file.isEmpty()) {
        m_inputPath->setText(file);
    }
}

void MainWindow::browseOutput() {
    QString file = QFileDialog::getSaveFileName(this, tr("Save Video"), QString(),
                                                tr("MP4 (*.mp4)"));
    if (file.isEmpty()) {
        return;
    }
    if (!file.endsWith(QStringLiteral(".mp4"), Qt::CaseInsensitive)) {
        file += QStringLiteral(".mp4");
    }
    m_outputPath->setText(file);
}

void MainWindow::startProcessing() {
    if (m_running) {
        appendLog(QStringLiteral("⚠ ") + tr("A video is already being processed."));
        return;
    }

    ProcessingJob job;
    std::string error;
    if (!parseProcessingJob(m_inputPath->text().toStdString(), m_outputPath->text().toStdString(),
                            m_threshold->text().toStdString(), m_minSilence->text().toStdString(),
                            job, error)) {
        qCWarning(lcUi).noquote() << "Rejected input:" << QString::fromStdString(error);
        appendLog(QStringLiteral("⚠ ") + QString::fromStdString(error));
        return;
    }

    m_running = true;
    m_startButton->setEnabled(false);
    m_progress->setValue(0);
    emit startRequested(job);
}

void MainWindow::onLogMessage(const QString& message) {
    appendLog(QStringLiteral("► ") + message);
}

void MainWindow::onFinished(bool ok) {
    qCDebug(lcUi) << "Job finished, ok =" << ok;
    appendLog(QStringLiteral("✔ ") + tr("Done!"));
    m_running = false;
    m_startButton->setEnabled(true);
}

void MainWindow::appendLog(const QString& line) {
    m_log->append(line);
}
