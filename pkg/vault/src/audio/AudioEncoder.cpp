// Repository: NarroVault
// Component: Audio Encoder
// Purpose: FFmpeg-based writing of mono PCM to lossless WAV (PCM S16LE) and
//          compressed MP3 artifacts.
// Copyright (c) 2026 NarroVault

#include "narrovault/audio/AudioEncoder.hpp"

#include <algorithm>
#include <cstring>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

namespace narrovault::audio {

namespace {

// PCM encoders accept any frame size.
constexpr int kDefaultFrameSize = 1024;

std::string AvError(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return std::string(errbuf);
}

class EncodeSession {
 public:
  ~EncodeSession() { Close(); }

  bool Open(const std::string& path, const PcmBuffer& pcm, const EncodeSettings& settings,
            std::string* error) {
    const bool wav = settings.container == AudioContainer::kWavPcm16;
    int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, wav ? "wav" : "mp3",
                                             path.c_str());
    if (ret < 0 || !format_ctx_) {
      *error = "[AudioEncoder] Failed to allocate output context: " + AvError(ret);
      return false;
    }
    format_ctx_->flags |= AVFMT_FLAG_BITEXACT;

    const AVCodec* codec = wav ? avcodec_find_encoder(AV_CODEC_ID_PCM_S16LE)
                               : avcodec_find_encoder_by_name("libmp3lame");
    if (!codec) {
      *error = std::string("[AudioEncoder] Encoder not available for ") +
               AudioContainerToString(settings.container);
      return false;
    }

    stream_ = avformat_new_stream(format_ctx_, codec);
    if (!stream_) {
      *error = "[AudioEncoder] Failed to create audio stream";
      return false;
    }
    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
      *error = "[AudioEncoder] Failed to allocate codec context";
      return false;
    }

    codec_ctx_->codec_id = codec->id;
    codec_ctx_->codec_type = AVMEDIA_TYPE_AUDIO;
    codec_ctx_->sample_fmt = AV_SAMPLE_FMT_S16;
    if (codec->sample_fmts) {
      codec_ctx_->sample_fmt = codec->sample_fmts[0];
    }
    codec_ctx_->sample_rate = pcm.sample_rate;
    ret = av_channel_layout_from_mask(&codec_ctx_->ch_layout, AV_CH_LAYOUT_MONO);
    if (ret < 0) {
      *error = "[AudioEncoder] Failed to set channel layout: " + AvError(ret);
      return false;
    }
    if (!wav) codec_ctx_->bit_rate = settings.bit_rate;
    codec_ctx_->time_base.num = 1;
    codec_ctx_->time_base.den = pcm.sample_rate;
    codec_ctx_->flags |= AV_CODEC_FLAG_BITEXACT;
    if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
      codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    ret = avcodec_open2(codec_ctx_, codec, nullptr);
    if (ret < 0) {
      *error = "[AudioEncoder] Failed to open encoder: " + AvError(ret);
      return false;
    }
    ret = avcodec_parameters_from_context(stream_->codecpar, codec_ctx_);
    if (ret < 0) {
      *error = "[AudioEncoder] Failed to copy codec parameters: " + AvError(ret);
      return false;
    }
    stream_->time_base = codec_ctx_->time_base;

    AVChannelLayout mono;
    std::memset(&mono, 0, sizeof(mono));
    av_channel_layout_from_mask(&mono, AV_CH_LAYOUT_MONO);
    ret = swr_alloc_set_opts2(&swr_ctx_, &mono, codec_ctx_->sample_fmt, pcm.sample_rate,
                              &mono, AV_SAMPLE_FMT_FLT, pcm.sample_rate, 0, nullptr);
    av_channel_layout_uninit(&mono);
    if (ret < 0 || !swr_ctx_ || (ret = swr_init(swr_ctx_)) < 0) {
      *error = "[AudioEncoder] Failed to configure sample converter: " + AvError(ret);
      return false;
    }

    frame_ = av_frame_alloc();
    packet_ = av_packet_alloc();
    if (!frame_ || !packet_) {
      *error = "[AudioEncoder] Failed to allocate frame/packet";
      return false;
    }

    ret = avio_open(&format_ctx_->pb, path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      *error = "[AudioEncoder] Failed to open " + path + ": " + AvError(ret);
      return false;
    }
    ret = avformat_write_header(format_ctx_, nullptr);
    if (ret < 0) {
      *error = "[AudioEncoder] Failed to write header: " + AvError(ret);
      return false;
    }
    return true;
  }

  bool EncodeAll(const PcmBuffer& pcm, std::string* error) {
    const int frame_size = codec_ctx_->frame_size > 0 ? codec_ctx_->frame_size : kDefaultFrameSize;
    size_t offset = 0;
    while (offset < pcm.samples.size()) {
      int n = static_cast<int>(std::min(static_cast<size_t>(frame_size),
                                        pcm.samples.size() - offset));
      frame_->nb_samples = n;
      frame_->format = codec_ctx_->sample_fmt;
      frame_->sample_rate = codec_ctx_->sample_rate;
      int ret = av_channel_layout_copy(&frame_->ch_layout, &codec_ctx_->ch_layout);
      if (ret >= 0) ret = av_frame_get_buffer(frame_, 0);
      if (ret < 0) {
        *error = "[AudioEncoder] Failed to allocate frame buffer: " + AvError(ret);
        return false;
      }
      const auto* src = reinterpret_cast<const uint8_t*>(pcm.samples.data() + offset);
      ret = swr_convert(swr_ctx_, frame_->data, n, &src, n);
      if (ret < 0) {
        *error = "[AudioEncoder] Sample conversion failed: " + AvError(ret);
        return false;
      }
      frame_->pts = static_cast<int64_t>(offset);
      ret = avcodec_send_frame(codec_ctx_, frame_);
      av_frame_unref(frame_);
      if (ret < 0) {
        *error = "[AudioEncoder] Failed to send frame: " + AvError(ret);
        return false;
      }
      if (!DrainPackets(error)) return false;
      offset += static_cast<size_t>(n);
    }

    int ret = avcodec_send_frame(codec_ctx_, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
      *error = "[AudioEncoder] Failed to flush encoder: " + AvError(ret);
      return false;
    }
    if (!DrainPackets(error)) return false;

    ret = av_write_trailer(format_ctx_);
    if (ret < 0) {
      *error = "[AudioEncoder] Failed to write trailer: " + AvError(ret);
      return false;
    }
    return true;
  }

 private:
  bool DrainPackets(std::string* error) {
    while (true) {
      int ret = avcodec_receive_packet(codec_ctx_, packet_);
      if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
      if (ret < 0) {
        *error = "[AudioEncoder] Failed to receive packet: " + AvError(ret);
        return false;
      }
      av_packet_rescale_ts(packet_, codec_ctx_->time_base, stream_->time_base);
      packet_->stream_index = stream_->index;
      ret = av_interleaved_write_frame(format_ctx_, packet_);
      av_packet_unref(packet_);
      if (ret < 0) {
        *error = "[AudioEncoder] Failed to write packet: " + AvError(ret);
        return false;
      }
    }
  }

  void Close() {
    if (swr_ctx_) swr_free(&swr_ctx_);
    if (frame_) av_frame_free(&frame_);
    if (packet_) av_packet_free(&packet_);
    if (codec_ctx_) avcodec_free_context(&codec_ctx_);
    if (format_ctx_) {
      if (format_ctx_->pb) avio_closep(&format_ctx_->pb);
      avformat_free_context(format_ctx_);
      format_ctx_ = nullptr;
    }
  }

  AVFormatContext* format_ctx_ = nullptr;
  AVStream* stream_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
};

}  // namespace

const char* AudioContainerToString(AudioContainer container) {
  switch (container) {
    case AudioContainer::kWavPcm16: return "wav";
    case AudioContainer::kMp3: return "mp3";
  }
  return "unknown";
}

bool AudioEncoder::WriteFile(const PcmBuffer& pcm, const std::string& path,
                             const EncodeSettings& settings, std::string* error) const {
  if (pcm.sample_rate <= 0) {
    *error = "[AudioEncoder] Invalid sample rate";
    return false;
  }
  EncodeSession session;
  if (!session.Open(path, pcm, settings, error)) return false;
  return session.EncodeAll(pcm, error);
}

}  // namespace narrovault::audio
