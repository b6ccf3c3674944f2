#include "VideoSplicer.h"

#include "FfmpegUtils.h"

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
}

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <system_error>

namespace {

constexpr AVRational kFallbackFrameRate{25, 1};

class Splicer {
  public:
    Splicer(const VideoSplicer::Settings& settings, std::string& error)
            : m_settings(settings), m_error(error) {
    }

    bool open(const std::string& inputPath, const std::string& outputPath);
    bool processSegment(const TimeRange& segment);
    bool finish();

  private:
    bool openVideoEncoder();
    bool openAudioEncoder();
    bool addOutputStream(AVCodecContext* enc, AVStream*& stream);

    bool decodePacket(AVCodecContext* dec, const AVPacket* packet, const TimeRange& segment);
    bool handleVideoFrame(const AVFrame* frame, const TimeRange& segment);
    bool handleAudioFrame(const AVFrame* frame, const TimeRange& segment);
    bool queueAudio(uint8_t** data, int offset, int count);
    bool alignAudio(double timelineEnd);
    bool drainFifo(bool flush);

    const VideoSplicer::Settings& m_settings;
    std::string& m_error;

    FormatContextPtr m_in;
    int m_videoIdx = -1;
    int m_audioIdx = -1;
    CodecContextPtr m_videoDec;
    CodecContextPtr m_audioDec;

    OutputContextPtr m_out;
    CodecContextPtr m_videoEnc;
    CodecContextPtr m_audioEnc;
    AVStream* m_videoStream = nullptr;
    AVStream* m_audioStream = nullptr;

    SwsContextPtr m_sws;
    SwrContextPtr m_swr;
    AudioFifoPtr m_fifo;
    FramePtr m_decoded;
    FramePtr m_scaled;
    FramePtr m_resampled;

    // Timestamp of the first input sample; segment times are relative to it.
    double m_startTime = 0.0;
    // Position in the output timeline where the current segment starts.
    double m_outputOffset = 0.0;
    int64_t m_lastVideoPts = AV_NOPTS_VALUE;
    int64_t m_audioSamplesWritten = 0;
    bool m_videoDone = false;
    bool m_audioDone = false;
};

bool Splicer::open(const std::string& inputPath, const std::string& outputPath) {
    // --- Input ---
    if (!openInput(inputPath, m_in, m_error)) {
        return false;
    }
    m_videoIdx = av_find_best_stream(m_in.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (m_videoIdx < 0) {
        m_error = "No video stream found";
        return false;
    }
    m_audioIdx = av_find_best_stream(m_in.get(), AVMEDIA_TYPE_AUDIO, -1, m_videoIdx, nullptr, 0);
    if (m_audioIdx < 0) {
        m_error = "No audio stream found";
        return false;
    }
    if (!openDecoder(m_in.get(), m_videoIdx, m_videoDec, m_error) ||
        !openDecoder(m_in.get(), m_audioIdx, m_audioDec, m_error)) {
        return false;
    }
    if (m_in->start_time != AV_NOPTS_VALUE) {
        m_startTime = static_cast<double>(m_in->start_time) / AV_TIME_BASE;
    }

    // --- Output container ---
    AVFormatContext* rawOut = nullptr;
    if (avformat_alloc_output_context2(&rawOut, nullptr, nullptr, outputPath.c_str()) < 0) {
        int err = avformat_alloc_output_context2(&rawOut, nullptr, "mp4", outputPath.c_str());
        if (err < 0) {
            m_error = "avformat_alloc_output_context2: " + avError(err);
            return false;
        }
    }
    m_out.reset(rawOut);

    if (!openVideoEncoder() || !openAudioEncoder()) {
        return false;
    }
    if (!addOutputStream(m_videoEnc.get(), m_videoStream) ||
        !addOutputStream(m_audioEnc.get(), m_audioStream)) {
        return false;
    }

    if (!(m_out->oformat->flags & AVFMT_NOFILE)) {
        if (int err = avio_open(&m_out->pb, outputPath.c_str(), AVIO_FLAG_WRITE); err < 0) {
            m_error = "avio_open '" + outputPath + "': " + avError(err);
            return false;
        }
    }
    if (int err = avformat_write_header(m_out.get(), nullptr); err < 0) {
        m_error = "avformat_write_header: " + avError(err);
        return false;
    }

    // --- Resampler and FIFO for the audio encoder ---
    SwrContext* rawSwr = nullptr;
    if (int err = swr_alloc_set_opts2(&rawSwr, &m_audioEnc->ch_layout, m_audioEnc->sample_fmt,
                                      m_audioEnc->sample_rate, &m_audioDec->ch_layout,
                                      m_audioDec->sample_fmt, m_audioDec->sample_rate, 0,
                                      nullptr);
        err < 0) {
        m_error = "swr_alloc_set_opts2: " + avError(err);
        return false;
    }
    m_swr.reset(rawSwr);
    if (int err = swr_init(m_swr.get()); err < 0) {
        m_error = "swr_init: " + avError(err);
        return false;
    }

    const int frameSize = m_audioEnc->frame_size > 0 ? m_audioEnc->frame_size : 1024;
    m_fifo.reset(av_audio_fifo_alloc(m_audioEnc->sample_fmt, m_audioEnc->ch_layout.nb_channels,
                                     frameSize));

    m_decoded.reset(av_frame_alloc());
    m_scaled.reset(av_frame_alloc());
    m_resampled.reset(av_frame_alloc());
    if (!m_fifo || !m_decoded || !m_scaled || !m_resampled) {
        m_error = "Out of memory";
        return false;
    }

    m_scaled->format = m_videoEnc->pix_fmt;
    m_scaled->width = m_videoEnc->width;
    m_scaled->height = m_videoEnc->height;
    if (int err = av_frame_get_buffer(m_scaled.get(), 0); err < 0) {
        m_error = "av_frame_get_buffer: " + avError(err);
        return false;
    }
    return true;
}

bool Splicer::openVideoEncoder() {
    const AVCodec* codec = avcodec_find_encoder_by_name(m_settings.videoEncoder.c_str());
    if (!codec) {
        m_error = "Video encoder '" + m_settings.videoEncoder + "' not available";
        return false;
    }
    m_videoEnc.reset(avcodec_alloc_context3(codec));
    if (!m_videoEnc) {
        m_error = "avcodec_alloc_context3 failed";
        return false;
    }

    AVStream* inStream = m_in->streams[m_videoIdx];
    AVRational frameRate = av_guess_frame_rate(m_in.get(), inStream, nullptr);
    if (frameRate.num <= 0 || frameRate.den <= 0) {
        frameRate = kFallbackFrameRate;
    }

    // 4:2:0 chroma needs even dimensions.
    m_videoEnc->width = m_videoDec->width & ~1;
    m_videoEnc->height = m_videoDec->height & ~1;
    m_videoEnc->sample_aspect_ratio = m_videoDec->sample_aspect_ratio;
    m_videoEnc->pix_fmt = AV_PIX_FMT_YUV420P;
    m_videoEnc->framerate = frameRate;
    m_videoEnc->time_base = av_inv_q(frameRate);
    if (m_out->oformat->flags & AVFMT_GLOBALHEADER) {
        m_videoEnc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    if (int err = avcodec_open2(m_videoEnc.get(), codec, nullptr); err < 0) {
        m_error = "avcodec_open2 (" + m_settings.videoEncoder + "): " + avError(err);
        return false;
    }
    return true;
}

bool Splicer::openAudioEncoder() {
    const AVCodec* codec = avcodec_find_encoder_by_name(m_settings.audioEncoder.c_str());
    if (!codec) {
        m_error = "Audio encoder '" + m_settings.audioEncoder + "' not available";
        return false;
    }
    m_audioEnc.reset(avcodec_alloc_context3(codec));
    if (!m_audioEnc) {
        m_error = "avcodec_alloc_context3 failed";
        return false;
    }

    m_audioEnc->sample_fmt = AV_SAMPLE_FMT_FLTP;
    m_audioEnc->sample_rate = m_audioDec->sample_rate;
    if (int err = av_channel_layout_copy(&m_audioEnc->ch_layout, &m_audioDec->ch_layout);
        err < 0) {
        m_error = "av_channel_layout_copy: " + avError(err);
        return false;
    }
    m_audioEnc->bit_rate = m_settings.audioBitRate;
    m_audioEnc->time_base = AVRational{1, m_audioDec->sample_rate};
    if (m_out->oformat->flags & AVFMT_GLOBALHEADER) {
        m_audioEnc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    if (int err = avcodec_open2(m_audioEnc.get(), codec, nullptr); err < 0) {
        m_error = "avcodec_open2 (" + m_settings.audioEncoder + "): " + avError(err);
        return false;
    }
    return true;
}

bool Splicer::addOutputStream(AVCodecContext* enc, AVStream*& stream) {
    stream = avformat_new_stream(m_out.get(), nullptr);
    if (!stream) {
        m_error = "avformat_new_stream failed";
        return false;
    }
    stream->time_base = enc->time_base;
    if (int err = avcodec_parameters_from_context(stream->codecpar, enc); err < 0) {
        m_error = "avcodec_parameters_from_context: " + avError(err);
        return false;
    }
    return true;
}

bool Splicer::processSegment(const TimeRange& segment) {
    // Seek to the keyframe at or before the segment start; frames before
    // the start are decoded and dropped.
    const int64_t target = static_cast<int64_t>((m_startTime + segment.start) * AV_TIME_BASE);
    if (int err = av_seek_frame(m_in.get(), -1, target, AVSEEK_FLAG_BACKWARD); err < 0) {
        m_error = "av_seek_frame: " + avError(err);
        return false;
    }
    avcodec_flush_buffers(m_videoDec.get());
    avcodec_flush_buffers(m_audioDec.get());
    m_videoDone = false;
    m_audioDone = false;

    PacketPtr pkt(av_packet_alloc());
    if (!pkt) {
        m_error = "Out of memory";
        return false;
    }

    int readErr = 0;
    while (!(m_videoDone && m_audioDone) &&
           (readErr = av_read_frame(m_in.get(), pkt.get())) >= 0) {
        bool ok = true;
        if (pkt->stream_index == m_videoIdx && !m_videoDone) {
            ok = decodePacket(m_videoDec.get(), pkt.get(), segment);
        } else if (pkt->stream_index == m_audioIdx && !m_audioDone) {
            ok = decodePacket(m_audioDec.get(), pkt.get(), segment);
        }
        av_packet_unref(pkt.get());
        if (!ok)
            return false;
    }

    if (!(m_videoDone && m_audioDone)) {
        if (readErr != AVERROR_EOF) {
            m_error = "av_read_frame: " + avError(readErr);
            return false;
        }
        // End of input inside the segment: drain what the decoders hold.
        if ((!m_videoDone && !decodePacket(m_videoDec.get(), nullptr, segment)) ||
            (!m_audioDone && !decodePacket(m_audioDec.get(), nullptr, segment))) {
            return false;
        }
    }

    m_outputOffset += segment.duration();
    return alignAudio(m_outputOffset);
}

bool Splicer::decodePacket(AVCodecContext* dec, const AVPacket* packet,
                           const TimeRange& segment) {
    int err = avcodec_send_packet(dec, packet);
    if (err < 0 && err != AVERROR(EAGAIN) && err != AVERROR_INVALIDDATA && err != AVERROR_EOF) {
        m_error = "avcodec_send_packet: " + avError(err);
        return false;
    }

    while (true) {
        err = avcodec_receive_frame(dec, m_decoded.get());
        if (err == AVERROR(EAGAIN) || err == AVERROR_EOF)
            return true;
        if (err < 0) {
            m_error = "avcodec_receive_frame: " + avError(err);
            return false;
        }
        bool ok = dec == m_videoDec.get() ? handleVideoFrame(m_decoded.get(), segment)
                                          : handleAudioFrame(m_decoded.get(), segment);
        av_frame_unref(m_decoded.get());
        if (!ok)
            return false;
    }
}

bool Splicer::handleVideoFrame(const AVFrame* frame, const TimeRange& segment) {
    if (m_videoDone || frame->best_effort_timestamp == AV_NOPTS_VALUE)
        return true;

    const double t =
            frame->best_effort_timestamp * av_q2d(m_in->streams[m_videoIdx]->time_base) -
            m_startTime;
    if (t < segment.start)
        return true;
    if (t >= segment.end) {
        m_videoDone = true;
        return true;
    }

    const double outTime = m_outputOffset + (t - segment.start);
    const int64_t pts = std::llround(outTime / av_q2d(m_videoEnc->time_base));
    // Two source frames landing on the same output tick: keep the first.
    if (m_lastVideoPts != AV_NOPTS_VALUE && pts <= m_lastVideoPts)
        return true;

    m_sws.reset(sws_getCachedContext(m_sws.release(), frame->width, frame->height,
                                     static_cast<AVPixelFormat>(frame->format),
                                     m_videoEnc->width, m_videoEnc->height,
                                     m_videoEnc->pix_fmt, SWS_BICUBIC, nullptr, nullptr,
                                     nullptr));
    if (!m_sws) {
        m_error = "sws_getCachedContext failed";
        return false;
    }
    if (int err = av_frame_make_writable(m_scaled.get()); err < 0) {
        m_error = "av_frame_make_writable: " + avError(err);
        return false;
    }
    if (sws_scale(m_sws.get(), frame->data, frame->linesize, 0, frame->height, m_scaled->data,
                  m_scaled->linesize) <= 0) {
        m_error = "sws_scale failed";
        return false;
    }

    m_scaled->pts = pts;
    m_lastVideoPts = pts;
    return encodeAndWrite(m_videoEnc.get(), m_out.get(), m_videoStream, m_scaled.get(),
                          m_error);
}

bool Splicer::handleAudioFrame(const AVFrame* frame, const TimeRange& segment) {
    if (m_audioDone || frame->best_effort_timestamp == AV_NOPTS_VALUE)
        return true;

    const double rate = m_audioEnc->sample_rate;
    const double t =
            frame->best_effort_timestamp * av_q2d(m_in->streams[m_audioIdx]->time_base) -
            m_startTime;
    const double frameEnd = t + static_cast<double>(frame->nb_samples) / frame->sample_rate;
    if (frameEnd <= segment.start)
        return true;
    if (t >= segment.end) {
        m_audioDone = true;
        return true;
    }

    // --- Convert to the encoder format ---
    const int maxOut = swr_get_out_samples(m_swr.get(), frame->nb_samples);
    av_frame_unref(m_resampled.get());
    m_resampled->format = m_audioEnc->sample_fmt;
    m_resampled->sample_rate = m_audioEnc->sample_rate;
    m_resampled->nb_samples = maxOut;
    if (int err = av_channel_layout_copy(&m_resampled->ch_layout, &m_audioEnc->ch_layout);
        err < 0) {
        m_error = "av_channel_layout_copy: " + avError(err);
        return false;
    }
    if (int err = av_frame_get_buffer(m_resampled.get(), 0); err < 0) {
        m_error = "av_frame_get_buffer: " + avError(err);
        return false;
    }
    const int converted =
            swr_convert(m_swr.get(), m_resampled->data, maxOut,
                        const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
    if (converted < 0) {
        m_error = "swr_convert: " + avError(converted);
        return false;
    }

    // --- Trim to [segment.start, segment.end) ---
    const int skip = std::clamp(static_cast<int>(std::llround((segment.start - t) * rate)), 0,
                                converted);
    const int stop = std::clamp(static_cast<int>(std::llround((segment.end - t) * rate)), skip,
                                converted);
    if (t + static_cast<double>(converted) / rate >= segment.end) {
        m_audioDone = true;
    }
    if (stop > skip && !queueAudio(m_resampled->data, skip, stop - skip)) {
        return false;
    }
    return drainFifo(false);
}

bool Splicer::queueAudio(uint8_t** data, int offset, int count) {
    const AVSampleFormat fmt = m_audioEnc->sample_fmt;
    const int channels = m_audioEnc->ch_layout.nb_channels;
    const int bytesPerSample = av_get_bytes_per_sample(fmt);

    void* planes[AV_NUM_DATA_POINTERS] = {};
    if (av_sample_fmt_is_planar(fmt)) {
        for (int ch = 0; ch < channels && ch < AV_NUM_DATA_POINTERS; ++ch) {
            planes[ch] = data[ch] + static_cast<std::ptrdiff_t>(offset) * bytesPerSample;
        }
    } else {
        planes[0] = data[0] + static_cast<std::ptrdiff_t>(offset) * bytesPerSample * channels;
    }

    if (av_audio_fifo_write(m_fifo.get(), planes, count) < count) {
        m_error = "av_audio_fifo_write failed";
        return false;
    }
    return true;
}

// Pads with silence or drops queued samples so that the audio track ends
// exactly where the video timeline does.
bool Splicer::alignAudio(double timelineEnd) {
    const int64_t expected = std::llround(timelineEnd * m_audioEnc->sample_rate);
    const int64_t queued = m_audioSamplesWritten + av_audio_fifo_size(m_fifo.get());

    if (queued > expected) {
        const int excess = static_cast<int>(
                std::min<int64_t>(queued - expected, av_audio_fifo_size(m_fifo.get())));
        if (int err = av_audio_fifo_drain(m_fifo.get(), excess); err < 0) {
            m_error = "av_audio_fifo_drain: " + avError(err);
            return false;
        }
    } else if (queued < expected) {
        const int missing = static_cast<int>(expected - queued);
        uint8_t** silence = nullptr;
        const int channels = m_audioEnc->ch_layout.nb_channels;
        if (int err = av_samples_alloc_array_and_samples(&silence, nullptr, channels, missing,
                                                         m_audioEnc->sample_fmt, 0);
            err < 0) {
            m_error = "av_samples_alloc_array_and_samples: " + avError(err);
            return false;
        }
        av_samples_set_silence(silence, 0, missing, channels, m_audioEnc->sample_fmt);
        const bool ok = queueAudio(silence, 0, missing);
        av_freep(&silence[0]);
        av_freep(&silence);
        if (!ok)
            return false;
    }
    return drainFifo(false);
}

bool Splicer::drainFifo(bool flush) {
    const int frameSize = m_audioEnc->frame_size > 0 ? m_audioEnc->frame_size
                                                     : av_audio_fifo_size(m_fifo.get());
    while (av_audio_fifo_size(m_fifo.get()) >= frameSize ||
           (flush && av_audio_fifo_size(m_fifo.get()) > 0)) {
        const int n = std::min(frameSize, av_audio_fifo_size(m_fifo.get()));
        if (n <= 0)
            break;

        FramePtr out(av_frame_alloc());
        if (!out) {
            m_error = "Out of memory";
            return false;
        }
        out->format = m_audioEnc->sample_fmt;
        out->sample_rate = m_audioEnc->sample_rate;
        out->nb_samples = n;
        if (int err = av_channel_layout_copy(&out->ch_layout, &m_audioEnc->ch_layout); err < 0) {
            m_error = "av_channel_layout_copy: " + avError(err);
            return false;
        }
        if (int err = av_frame_get_buffer(out.get(), 0); err < 0) {
            m_error = "av_frame_get_buffer: " + avError(err);
            return false;
        }
        if (av_audio_fifo_read(m_fifo.get(), reinterpret_cast<void**>(out->data), n) < n) {
            m_error = "av_audio_fifo_read failed";
            return false;
        }
        out->pts = m_audioSamplesWritten;
        m_audioSamplesWritten += n;
        if (!encodeAndWrite(m_audioEnc.get(), m_out.get(), m_audioStream, out.get(), m_error))
            return false;
    }
    return true;
}

bool Splicer::finish() {
    if (!drainFifo(true))
        return false;
    if (!encodeAndWrite(m_videoEnc.get(), m_out.get(), m_videoStream, nullptr, m_error) ||
        !encodeAndWrite(m_audioEnc.get(), m_out.get(), m_audioStream, nullptr, m_error)) {
        return false;
    }
    if (int err = av_write_trailer(m_out.get()); err < 0) {
        m_error = "av_write_trailer: " + avError(err);
        return false;
    }
    return true;
}

}  // namespace

bool VideoSplicer::splice(const std::string& inputPath, const std::string& outputPath,
                          const std::vector<TimeRange>& segments, const Settings& settings,
                          const ProgressCallback& progress, std::string& error) {
    if (segments.empty()) {
        error = "Nothing to splice: no segments";
        return false;
    }
    // Opening the output for writing would truncate the input being read.
    std::error_code ec;
    if (inputPath == outputPath || std::filesystem::equivalent(inputPath, outputPath, ec)) {
        error = "Output '" + outputPath + "' is the same file as the input";
        return false;
    }

    Splicer splicer(settings, error);
    if (!splicer.open(inputPath, outputPath)) {
        return false;
    }

    const int total = static_cast<int>(segments.size());
    for (int i = 0; i < total; ++i) {
        if (!splicer.processSegment(segments[i])) {
            error = "segment " + std::to_string(i + 1) + "/" + std::to_string(total) + ": " +
                    error;
            return false;
        }
        if (progress) {
            progress(i + 1, total);
        }
    }
    return splicer.finish();
}
