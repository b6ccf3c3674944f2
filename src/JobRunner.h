#pragma once

#include <QMetaType>
#include <QObject>
#include <QString>

#include <string>

#include "ProcessingJob.h"

Q_DECLARE_METATYPE(ProcessingJob)

// Runs a silence removal job from start to finish: audio extraction,
// silence detection, segment splicing and clean-up of the temporary audio.
//
// Meant to live on a worker thread; the UI talks to it through queued
// signals only. Every run ends with exactly one finished() signal, whether
// it succeeded or not.
class JobRunner : public QObject {
    Q_OBJECT

  public:
    explicit JobRunner(QObject* parent = nullptr);

  public slots:
    void run(const ProcessingJob& job);

  signals:
    void logMessage(const QString& message);
    void progressChanged(int percent);
    void finished(bool ok);

  private:
    bool process(const ProcessingJob& job, std::string& error);
    void report(const QString& message);
};
