#include "SilenceAnalyzer.h"

#include <algorithm>
#include <cmath>

SilenceAnalyzer::SilenceAnalyzer(int sampleRate, int channels)
        : m_sampleRate(sampleRate),
          m_channels(channels),
          m_framesProcessed(0),
          m_sumSquares(0) {
}

void SilenceAnalyzer::feed(const int16_t* samples, int numFrames) {
    for (int f = 0; f < numFrames; ++f) {
        // Record the running sum at every millisecond boundary reached.
        while (frameAtMs(static_cast<long long>(m_prefix.size())) <= m_framesProcessed) {
            m_prefix.push_back(m_sumSquares);
        }
        for (int c = 0; c < m_channels; ++c) {
            const long long s = samples[f * m_channels + c];
            m_sumSquares += static_cast<unsigned long long>(s * s);
        }
        ++m_framesProcessed;
    }
}

long long SilenceAnalyzer::durationMs() const {
    if (m_sampleRate <= 0) return 0;
    return std::llround(static_cast<double>(m_framesProcessed) * 1000.0 / m_sampleRate);
}

std::vector<SilenceAnalyzer::Range> SilenceAnalyzer::detect(int minSilenceMs,
                                                            double thresholdDb) const {
    std::vector<Range> ranges;
    const long long lengthMs = durationMs();
    if (minSilenceMs <= 0 || lengthMs < minSilenceMs) {
        return ranges;
    }

    const double threshold = std::pow(10.0, thresholdDb / 20.0) * kMaxAmplitude;

    // --- Find every silent window start ---
    std::vector<long long> silentStarts;
    const long long lastStart = lengthMs - minSilenceMs;
    for (long long i = 0; i <= lastStart; ++i) {
        if (windowRms(i, i + minSilenceMs) <= threshold) {
            silentStarts.push_back(i);
        }
    }
    if (silentStarts.empty()) {
        return ranges;
    }

    // --- Merge runs of silent windows into ranges ---
    long long prev = silentStarts.front();
    long long rangeStart = prev;
    for (std::size_t j = 1; j < silentStarts.size(); ++j) {
        const long long start = silentStarts[j];
        const bool continuous = start == prev + 1;
        const bool hasGap = start > prev + minSilenceMs;
        if (!continuous && hasGap) {
            ranges.push_back({rangeStart, prev + minSilenceMs});
            rangeStart = start;
        }
        prev = start;
    }
    ranges.push_back({rangeStart, prev + minSilenceMs});
    return ranges;
}

long long SilenceAnalyzer::frameAtMs(long long ms) const {
    return ms * m_sampleRate / 1000;
}

unsigned long long SilenceAnalyzer::sumBefore(long long ms) const {
    if (ms < static_cast<long long>(m_prefix.size())) {
        return m_prefix[static_cast<std::size_t>(ms)];
    }
    return m_sumSquares;
}

double SilenceAnalyzer::windowRms(long long fromMs, long long toMs) const {
    const long long fromFrame = std::min(frameAtMs(fromMs), m_framesProcessed);
    const long long toFrame = std::min(frameAtMs(toMs), m_framesProcessed);
    const long long count = (toFrame - fromFrame) * m_channels;
    if (count <= 0) {
        return 0.0;
    }
    const unsigned long long sum = sumBefore(toMs) - sumBefore(fromMs);
    return std::floor(std::sqrt(static_cast<double>(sum) / static_cast<double>(count)));
}
