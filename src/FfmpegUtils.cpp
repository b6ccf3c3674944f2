#include "FfmpegUtils.h"

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/log.h>
}

std::string avError(int err) {
    char buf[256];
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

bool openInput(const std::string& path, FormatContextPtr& fmt, std::string& error) {
    av_log_set_level(AV_LOG_ERROR);  // suppress decoder warnings (timestamp drift etc.)

    AVFormatContext* rawFmt = nullptr;
    if (int err = avformat_open_input(&rawFmt, path.c_str(), nullptr, nullptr); err < 0) {
        error = "avformat_open_input: " + avError(err);
        return false;
    }
    fmt.reset(rawFmt);

    if (int err = avformat_find_stream_info(fmt.get(), nullptr); err < 0) {
        error = "avformat_find_stream_info: " + avError(err);
        return false;
    }
    return true;
}

bool openDecoder(AVFormatContext* fmt, int streamIdx, CodecContextPtr& codecCtx,
                 std::string& error) {
    AVStream* stream = fmt->streams[streamIdx];

    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) {
        error = "Unsupported codec";
        return false;
    }
    codecCtx.reset(avcodec_alloc_context3(codec));
    if (!codecCtx) {
        error = "avcodec_alloc_context3 failed";
        return false;
    }
    if (int err = avcodec_parameters_to_context(codecCtx.get(), stream->codecpar); err < 0) {
        error = "avcodec_parameters_to_context: " + avError(err);
        return false;
    }
    codecCtx->pkt_timebase = stream->time_base;
    if (int err = avcodec_open2(codecCtx.get(), codec, nullptr); err < 0) {
        error = "avcodec_open2: " + avError(err);
        return false;
    }
    // libswresample needs a concrete layout, not just a channel count.
    if (codecCtx->codec_type == AVMEDIA_TYPE_AUDIO &&
        codecCtx->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
        const int channels = codecCtx->ch_layout.nb_channels;
        av_channel_layout_uninit(&codecCtx->ch_layout);
        av_channel_layout_default(&codecCtx->ch_layout, channels);
    }
    return true;
}

bool encodeAndWrite(AVCodecContext* enc, AVFormatContext* out, AVStream* stream,
                    const AVFrame* frame, std::string& error) {
    if (int err = avcodec_send_frame(enc, frame);
        err < 0 && !(frame == nullptr && err == AVERROR_EOF)) {
        error = "avcodec_send_frame: " + avError(err);
        return false;
    }

    PacketPtr pkt(av_packet_alloc());
    if (!pkt) {
        error = "Out of memory";
        return false;
    }
    while (true) {
        int err = avcodec_receive_packet(enc, pkt.get());
        if (err == AVERROR(EAGAIN) || err == AVERROR_EOF)
            return true;
        if (err < 0) {
            error = "avcodec_receive_packet: " + avError(err);
            return false;
        }
        av_packet_rescale_ts(pkt.get(), enc->time_base, stream->time_base);
        pkt->stream_index = stream->index;
        // av_interleaved_write_frame takes ownership of the packet's data.
        err = av_interleaved_write_frame(out, pkt.get());
        if (err < 0) {
            error = "av_interleaved_write_frame: " + avError(err);
            return false;
        }
    }
}
