#pragma once

#include <QMainWindow>
#include <QThread>

#include "JobRunner.h"

class QLineEdit;
class QProgressBar;
class QPushButton;
class QTextEdit;
class QLayout;

class MainWindow : public QMainWindow {
    Q_OBJECT

  public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

  signals:
    void startRequested(const ProcessingJob& job);

  private slots:
    void browseInput();
    void browseOutput();
    void startProcessing();
    void onLogMessage(const QString& message);
    void onFinished(bool ok);

  private:
    void setupUi();
    void setupStyle();
    QLayout* createFileSection();
    QLayout* createSettingsSection();
    void appendLog(const QString& line);

    QLineEdit* m_inputPath = nullptr;
    QLineEdit* m_outputPath = nullptr;
    QLineEdit* m_threshold = nullptr;
    QLineEdit* m_minSilence = nullptr;
    QProgressBar* m_progress = nullptr;
    QTextEdit* m_log = nullptr;
    QPushButton* m_startButton = nullptr;

    QThread m_workerThread;
    JobRunner* m_runner = nullptr;  // deleted when m_workerThread finishes
    bool m_running = false;
};
