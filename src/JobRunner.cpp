#include "JobRunner.h"

#include <QDir>
#include <QTemporaryFile>

#include <exception>
#include <memory>
#include <vector>

#include "AudioDecoder.h"
#include "AudioExtractor.h"
#include "Logging.h"
#include "SegmentExtractor.h"
#include "SilenceAnalyzer.h"

namespace {

// Progress milestones, in percent.
constexpr int kProgressExtracting = 5;
constexpr int kProgressAnalyzing = 25;
constexpr int kProgressSplicing = 40;
constexpr int kProgressDone = 100;

}  // namespace

JobRunner::JobRunner(QObject* parent) : QObject(parent) {
}

void JobRunner::run(const ProcessingJob& job) {
    qCInfo(lcJob) << "Starting job" << QString::fromStdString(job.inputPath) << "->"
                  << QString::fromStdString(job.outputPath) << "threshold" << job.thresholdDb
                  << "dB, min silence" << job.minSilenceMs << "ms";

    std::string error;
    bool ok = false;
    try {
        ok = process(job, error);
    } catch (const std::exception& e) {
        error = e.what();
    }

    if (ok) {
        report(tr("Processing complete!"));
        emit progressChanged(kProgressDone);
    } else {
        qCWarning(lcJob).noquote() << "Job failed:" << QString::fromStdString(error);
        report(tr("Critical error: %1").arg(QString::fromStdString(error)));
    }
    emit finished(ok);
}

bool JobRunner::process(const ProcessingJob& job, std::string& error) {
    // --- Extract the audio track to a per-job temporary WAV ---
    report(tr("Extracting audio from video..."));
    emit progressChanged(kProgressExtracting);

    // Removed when this function returns, on every path.
    const QString tempDir = job.config.tempDir.empty()
                                    ? QDir::tempPath()
                                    : QString::fromStdString(job.config.tempDir);
    QTemporaryFile wavFile(tempDir + QStringLiteral("/silencecut-XXXXXX.wav"));
    if (!wavFile.open()) {
        error = "Cannot create temporary audio file: " + wavFile.errorString().toStdString();
        return false;
    }
    const std::string wavPath = wavFile.fileName().toStdString();
    wavFile.close();
    qCDebug(lcJob) << "Temporary audio file" << wavFile.fileName();

    if (!AudioExtractor::extract(job.inputPath, wavPath, job.config.analysisFormat, error)) {
        return false;
    }

    // --- Detect silence ---
    report(tr("Analyzing silence..."));
    emit progressChanged(kProgressAnalyzing);

    std::unique_ptr<SilenceAnalyzer> analyzer;
    bool ok = AudioDecoder::decode(
            wavPath,
            [&](const int16_t* samples, int numFrames, const AudioDecoder::AudioInfo& info) {
                if (!analyzer) {
                    analyzer = std::make_unique<SilenceAnalyzer>(info.sampleRate, info.channels);
                }
                analyzer->feed(samples, numFrames);
            },
            error);
    if (!ok) {
        return false;
    }

    // An audio track without samples has length 0 and nothing to keep.
    std::vector<TimeRange> silences;
    double totalDuration = 0.0;
    if (analyzer) {
        for (const SilenceAnalyzer::Range& r :
             analyzer->detect(job.minSilenceMs, job.thresholdDb)) {
            silences.push_back({r.startMs / 1000.0, r.endMs / 1000.0});
        }
        totalDuration = analyzer->durationMs() / 1000.0;
    } else {
        qCInfo(lcJob) << "No audio samples in" << QString::fromStdString(job.inputPath);
    }
    const std::vector<TimeRange> segments = SegmentExtractor::complement(silences, totalDuration);

    qCInfo(lcJob) << "Audio length" << totalDuration << "s," << silences.size()
                  << "silent ranges," << segments.size() << "segments kept";

    // --- Write the output ---
    emit progressChanged(kProgressSplicing);
    if (segments.empty()) {
        report(tr("The whole input is silent! Copying the original video..."));
    } else {
        report(tr("Assembling video from %n segment(s)...", nullptr,
                  static_cast<int>(segments.size())));
    }

    auto onProgress = [this](int done, int total) {
        const int span = kProgressDone - kProgressSplicing;
        emit progressChanged(kProgressSplicing + span * done / total);
    };
    return SegmentExtractor::splice(job.inputPath, job.outputPath, segments,
                                    job.config.spliceSettings, onProgress, error);
}

void JobRunner::report(const QString& message) {
    qCInfo(lcJob).noquote() << message;
    emit logMessage(message);
}
