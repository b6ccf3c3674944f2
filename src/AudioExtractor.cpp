#include "AudioExtractor.h"

#include "FfmpegUtils.h"

extern "C" {
#include <libavutil/channel_layout.h>
}

bool AudioExtractor::extract(const std::string& inputPath, const std::string& wavPath,
                             const Format& format, std::string& error) {
    // --- Open input and its audio decoder ---
    FormatContextPtr in;
    if (!openInput(inputPath, in, error)) {
        return false;
    }
    int streamIdx = av_find_best_stream(in.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (streamIdx < 0) {
        error = "No audio stream found";
        return false;
    }
    CodecContextPtr dec;
    if (!openDecoder(in.get(), streamIdx, dec, error)) {
        return false;
    }

    // --- Output: WAV container with a pcm_s16le stream ---
    AVFormatContext* rawOut = nullptr;
    if (int err = avformat_alloc_output_context2(&rawOut, nullptr, "wav", wavPath.c_str());
        err < 0) {
        error = "avformat_alloc_output_context2: " + avError(err);
        return false;
    }
    OutputContextPtr out(rawOut);

    const AVCodec* pcm = avcodec_find_encoder(AV_CODEC_ID_PCM_S16LE);
    if (!pcm) {
        error = "pcm_s16le encoder not available";
        return false;
    }
    CodecContextPtr enc(avcodec_alloc_context3(pcm));
    if (!enc) {
        error = "avcodec_alloc_context3 failed";
        return false;
    }
    enc->sample_fmt = AV_SAMPLE_FMT_S16;
    enc->sample_rate = format.sampleRate;
    av_channel_layout_default(&enc->ch_layout, format.channels);
    enc->time_base = AVRational{1, format.sampleRate};
    if (int err = avcodec_open2(enc.get(), pcm, nullptr); err < 0) {
        error = "avcodec_open2 (pcm_s16le): " + avError(err);
        return false;
    }

    AVStream* outStream = avformat_new_stream(out.get(), nullptr);
    if (!outStream) {
        error = "avformat_new_stream failed";
        return false;
    }
    outStream->time_base = enc->time_base;
    if (int err = avcodec_parameters_from_context(outStream->codecpar, enc.get()); err < 0) {
        error = "avcodec_parameters_from_context: " + avError(err);
        return false;
    }

    if (int err = avio_open(&out->pb, wavPath.c_str(), AVIO_FLAG_WRITE); err < 0) {
        error = "avio_open '" + wavPath + "': " + avError(err);
        return false;
    }
    if (int err = avformat_write_header(out.get(), nullptr); err < 0) {
        error = "avformat_write_header: " + avError(err);
        return false;
    }

    // --- Resampler: decoder format -> s16 at the requested rate/layout ---
    SwrContext* rawSwr = nullptr;
    if (int err = swr_alloc_set_opts2(&rawSwr, &enc->ch_layout, enc->sample_fmt,
                                      enc->sample_rate, &dec->ch_layout, dec->sample_fmt,
                                      dec->sample_rate, 0, nullptr);
        err < 0) {
        error = "swr_alloc_set_opts2: " + avError(err);
        return false;
    }
    SwrContextPtr swr(rawSwr);
    if (int err = swr_init(swr.get()); err < 0) {
        error = "swr_init: " + avError(err);
        return false;
    }

    PacketPtr pkt(av_packet_alloc());
    FramePtr frame(av_frame_alloc());
    if (!pkt || !frame) {
        error = "Out of memory";
        return false;
    }

    int64_t nextPts = 0;

    // Converts 'inFrames' samples (nullptr drains the resampler) and encodes them.
    auto convertAndEncode = [&](const uint8_t** inData, int inFrames) -> bool {
        const int maxOut = swr_get_out_samples(swr.get(), inFrames);
        if (maxOut <= 0)
            return true;

        FramePtr outFrame(av_frame_alloc());
        if (!outFrame) {
            error = "Out of memory";
            return false;
        }
        outFrame->format = enc->sample_fmt;
        outFrame->sample_rate = enc->sample_rate;
        outFrame->nb_samples = maxOut;
        if (int err = av_channel_layout_copy(&outFrame->ch_layout, &enc->ch_layout); err < 0) {
            error = "av_channel_layout_copy: " + avError(err);
            return false;
        }
        if (int err = av_frame_get_buffer(outFrame.get(), 0); err < 0) {
            error = "av_frame_get_buffer: " + avError(err);
            return false;
        }

        int converted = swr_convert(swr.get(), outFrame->data, maxOut, inData, inFrames);
        if (converted < 0) {
            error = "swr_convert: " + avError(converted);
            return false;
        }
        if (converted == 0)
            return true;

        outFrame->nb_samples = converted;
        outFrame->pts = nextPts;
        nextPts += converted;
        return encodeAndWrite(enc.get(), out.get(), outStream, outFrame.get(), error);
    };

    auto receiveFrames = [&]() -> bool {
        while (true) {
            int err = avcodec_receive_frame(dec.get(), frame.get());
            if (err == AVERROR(EAGAIN) || err == AVERROR_EOF)
                return true;
            if (err < 0) {
                error = "avcodec_receive_frame: " + avError(err);
                return false;
            }
            bool ok = convertAndEncode(const_cast<const uint8_t**>(frame->extended_data),
                                       frame->nb_samples);
            av_frame_unref(frame.get());
            if (!ok)
                return false;
        }
    };

    // --- Transcode loop ---
    int readErr = 0;
    while ((readErr = av_read_frame(in.get(), pkt.get())) >= 0) {
        if (pkt->stream_index != streamIdx) {
            av_packet_unref(pkt.get());
            continue;
        }
        int err = avcodec_send_packet(dec.get(), pkt.get());
        av_packet_unref(pkt.get());
        if (err < 0 && err != AVERROR(EAGAIN) && err != AVERROR_INVALIDDATA) {
            error = "avcodec_send_packet: " + avError(err);
            return false;
        }
        if (!receiveFrames())
            return false;
    }
    if (readErr != AVERROR_EOF) {
        error = "av_read_frame: " + avError(readErr);
        return false;
    }

    // --- Flush decoder, resampler and encoder ---
    if (int err = avcodec_send_packet(dec.get(), nullptr); err < 0 && err != AVERROR_EOF) {
        error = "avcodec_send_packet (flush): " + avError(err);
        return false;
    }
    if (!receiveFrames())
        return false;
    if (!convertAndEncode(nullptr, 0))
        return false;
    if (!encodeAndWrite(enc.get(), out.get(), outStream, nullptr, error))
        return false;

    if (int err = av_write_trailer(out.get()); err < 0) {
        error = "av_write_trailer: " + avError(err);
        return false;
    }
    return true;
}
