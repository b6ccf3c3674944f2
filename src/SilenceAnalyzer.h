#pragma once

#include <cstdint>
#include <vector>

// Finds the silent stretches of a 16-bit PCM stream.
//
// A window of minSilenceMs is slid over the audio in 1 ms steps; windows
// whose RMS is at or below the threshold are silent, and overlapping or
// adjacent silent windows are merged into one range. This is the classic
// detect_silence() behaviour of the pydub family of tools.
class SilenceAnalyzer {
  public:
    // Millisecond range [startMs, endMs).
    struct Range {
        long long startMs;
        long long endMs;
    };

    explicit SilenceAnalyzer(int sampleRate, int channels);

    // Feed interleaved 16-bit samples (numFrames * channels values).
    void feed(const int16_t* samples, int numFrames);

    // Audio length in whole milliseconds (rounded). Call after all audio
    // has been fed.
    long long durationMs() const;

    // Returns ascending, non-overlapping silent ranges. thresholdDb is in
    // dBFS (0 = full scale, -40 = 1% of full scale).
    std::vector<Range> detect(int minSilenceMs, double thresholdDb) const;

  private:
    static constexpr double kMaxAmplitude = 32768.0;  // 16-bit full scale

    // First frame of millisecond 'ms'.
    long long frameAtMs(long long ms) const;
    // Integer RMS over frames [fromMs, toMs), clamped to the fed frames.
    double windowRms(long long fromMs, long long toMs) const;
    unsigned long long sumBefore(long long ms) const;

    int m_sampleRate;
    int m_channels;
    long long m_framesProcessed;
    unsigned long long m_sumSquares;
    // m_prefix[k] = sum of squared samples in frames [0, frameAtMs(k)).
    std::vector<unsigned long long> m_prefix;
};
