// Repository: NarroVault
// Component: Audio Decoder
// Purpose: FFmpeg-based decoding of synthesized audio bytes and vault files
//          into mono float PCM at the vault sample rate.
// Copyright (c) 2026 NarroVault

#include "narrovault/audio/AudioDecoder.hpp"

#include <algorithm>
#include <cstring>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/mem.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

namespace narrovault::audio {

namespace {

constexpr int kAvioBufferSize = 32 * 1024;

std::string AvError(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return std::string(errbuf);
}

// Read cursor over caller-owned bytes for the custom AVIOContext.
struct MemoryCursor {
  const uint8_t* data = nullptr;
  size_t size = 0;
  size_t pos = 0;
};

int ReadMemory(void* opaque, uint8_t* buf, int buf_size) {
  auto* cursor = static_cast<MemoryCursor*>(opaque);
  size_t remaining = cursor->size - cursor->pos;
  if (remaining == 0) return AVERROR_EOF;
  size_t n = std::min(remaining, static_cast<size_t>(buf_size));
  std::memcpy(buf, cursor->data + cursor->pos, n);
  cursor->pos += n;
  return static_cast<int>(n);
}

int64_t SeekMemory(void* opaque, int64_t offset, int whence) {
  auto* cursor = static_cast<MemoryCursor*>(opaque);
  if (whence == AVSEEK_SIZE) return static_cast<int64_t>(cursor->size);
  int64_t base = 0;
  switch (whence & ~AVSEEK_FORCE) {
    case SEEK_SET: base = 0; break;
    case SEEK_CUR: base = static_cast<int64_t>(cursor->pos); break;
    case SEEK_END: base = static_cast<int64_t>(cursor->size); break;
    default: return AVERROR(EINVAL);
  }
  int64_t target = base + offset;
  if (target < 0 || target > static_cast<int64_t>(cursor->size)) return AVERROR(EINVAL);
  cursor->pos = static_cast<size_t>(target);
  return target;
}

// Owns every FFmpeg object for one decode; Close() releases them in reverse
// order of creation.
class DecodeSession {
 public:
  explicit DecodeSession(int target_sample_rate) : target_sample_rate_(target_sample_rate) {}
  ~DecodeSession() { Close(); }

  DecodeSession(const DecodeSession&) = delete;
  DecodeSession& operator=(const DecodeSession&) = delete;

  bool OpenFile(const std::string& path, std::string* error) {
    int ret = avformat_open_input(&format_ctx_, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
      *error = "[AudioDecoder] Failed to open " + path + ": " + AvError(ret);
      return false;
    }
    return OpenStreams(error);
  }

  bool OpenMemory(const std::vector<uint8_t>& bytes, std::string* error) {
    if (bytes.empty()) {
      *error = "[AudioDecoder] Empty audio payload";
      return false;
    }
    cursor_.data = bytes.data();
    cursor_.size = bytes.size();
    cursor_.pos = 0;

    auto* avio_buffer = static_cast<uint8_t*>(av_malloc(kAvioBufferSize));
    if (!avio_buffer) {
      *error = "[AudioDecoder] Failed to allocate AVIO buffer";
      return false;
    }
    avio_ctx_ = avio_alloc_context(avio_buffer, kAvioBufferSize, 0, &cursor_,
                                   &ReadMemory, nullptr, &SeekMemory);
    if (!avio_ctx_) {
      av_free(avio_buffer);
      *error = "[AudioDecoder] Failed to allocate AVIO context";
      return false;
    }
    format_ctx_ = avformat_alloc_context();
    if (!format_ctx_) {
      *error = "[AudioDecoder] Failed to allocate format context";
      return false;
    }
    format_ctx_->pb = avio_ctx_;
    format_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

    int ret = avformat_open_input(&format_ctx_, nullptr, nullptr, nullptr);
    if (ret < 0) {
      // avformat_open_input frees the context on failure.
      format_ctx_ = nullptr;
      *error = "[AudioDecoder] Failed to read audio stream info: " + AvError(ret);
      return false;
    }
    return OpenStreams(error);
  }

  bool DecodeAll(PcmBuffer* out, std::string* error) {
    out->sample_rate = target_sample_rate_;
    out->samples.clear();

    int ret = 0;
    while ((ret = av_read_frame(format_ctx_, packet_)) >= 0) {
      if (packet_->stream_index == stream_index_) {
        ret = avcodec_send_packet(codec_ctx_, packet_);
        av_packet_unref(packet_);
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
          *error = "[AudioDecoder] Failed to send packet: " + AvError(ret);
          return false;
        }
        if (!ReceiveFrames(out, error)) return false;
      } else {
        av_packet_unref(packet_);
      }
    }
    if (ret != AVERROR_EOF) {
      *error = "[AudioDecoder] Read error: " + AvError(ret);
      return false;
    }

    // Drain decoder, then resampler.
    ret = avcodec_send_packet(codec_ctx_, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
      *error = "[AudioDecoder] Failed to flush decoder: " + AvError(ret);
      return false;
    }
    if (!ReceiveFrames(out, error)) return false;
    return FlushResampler(out, error);
  }

 private:
  bool OpenStreams(std::string* error) {
    int ret = avformat_find_stream_info(format_ctx_, nullptr);
    if (ret < 0) {
      *error = "[AudioDecoder] Failed to find stream info: " + AvError(ret);
      return false;
    }
    const AVCodec* codec = nullptr;
    stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
    if (stream_index_ < 0 || !codec) {
      *error = "[AudioDecoder] No audio stream found";
      return false;
    }

    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
      *error = "[AudioDecoder] Failed to allocate codec context";
      return false;
    }
    ret = avcodec_parameters_to_context(codec_ctx_,
                                        format_ctx_->streams[stream_index_]->codecpar);
    if (ret < 0) {
      *error = "[AudioDecoder] Failed to copy codec parameters: " + AvError(ret);
      return false;
    }
    ret = avcodec_open2(codec_ctx_, codec, nullptr);
    if (ret < 0) {
      *error = "[AudioDecoder] Failed to open codec: " + AvError(ret);
      return false;
    }

    frame_ = av_frame_alloc();
    packet_ = av_packet_alloc();
    if (!frame_ || !packet_) {
      *error = "[AudioDecoder] Failed to allocate frame/packet";
      return false;
    }
    return InitializeResampler(error);
  }

  bool InitializeResampler(std::string* error) {
    AVChannelLayout src_ch_layout;
    std::memset(&src_ch_layout, 0, sizeof(src_ch_layout));
    if (codec_ctx_->ch_layout.nb_channels > 0 &&
        codec_ctx_->ch_layout.order != AV_CHANNEL_ORDER_UNSPEC) {
      if (av_channel_layout_copy(&src_ch_layout, &codec_ctx_->ch_layout) < 0) {
        *error = "[AudioDecoder] Failed to copy source channel layout";
        return false;
      }
    } else {
      int channels = codec_ctx_->ch_layout.nb_channels > 0 ? codec_ctx_->ch_layout.nb_channels : 1;
      av_channel_layout_default(&src_ch_layout, channels);
    }

    AVChannelLayout dst_ch_layout;
    std::memset(&dst_ch_layout, 0, sizeof(dst_ch_layout));
    if (av_channel_layout_from_mask(&dst_ch_layout, AV_CH_LAYOUT_MONO) < 0) {
      av_channel_layout_uninit(&src_ch_layout);
      *error = "[AudioDecoder] Failed to create destination channel layout";
      return false;
    }

    int ret = swr_alloc_set_opts2(&swr_ctx_,
                                  &dst_ch_layout, AV_SAMPLE_FMT_FLT, target_sample_rate_,
                                  &src_ch_layout, codec_ctx_->sample_fmt,
                                  codec_ctx_->sample_rate, 0, nullptr);
    // swr_alloc_set_opts2 copies the layouts.
    av_channel_layout_uninit(&src_ch_layout);
    av_channel_layout_uninit(&dst_ch_layout);
    if (ret < 0 || !swr_ctx_) {
      *error = "[AudioDecoder] Failed to configure resampler: " + AvError(ret);
      return false;
    }
    ret = swr_init(swr_ctx_);
    if (ret < 0) {
      *error = "[AudioDecoder] Failed to initialize resampler: " + AvError(ret);
      return false;
    }
    return true;
  }

  bool ReceiveFrames(PcmBuffer* out, std::string* error) {
    while (true) {
      int ret = avcodec_receive_frame(codec_ctx_, frame_);
      if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
      if (ret < 0) {
        *error = "[AudioDecoder] Failed to receive frame: " + AvError(ret);
        return false;
      }
      bool ok = ConvertFrame(frame_, out, error);
      av_frame_unref(frame_);
      if (!ok) return false;
    }
  }

  bool ConvertFrame(const AVFrame* frame, PcmBuffer* out, std::string* error) {
    int64_t delay = swr_get_delay(swr_ctx_, codec_ctx_->sample_rate);
    int max_out = static_cast<int>(av_rescale_rnd(delay + frame->nb_samples,
                                                  target_sample_rate_,
                                                  codec_ctx_->sample_rate, AV_ROUND_UP));
    size_t offset = out->samples.size();
    out->samples.resize(offset + static_cast<size_t>(max_out));
    auto* dst = reinterpret_cast<uint8_t*>(out->samples.data() + offset);
    int converted = swr_convert(swr_ctx_, &dst, max_out,
                                const_cast<const uint8_t**>(frame->extended_data),
                                frame->nb_samples);
    if (converted < 0) {
      out->samples.resize(offset);
      *error = "[AudioDecoder] Resample failed: " + AvError(converted);
      return false;
    }
    out->samples.resize(offset + static_cast<size_t>(converted));
    return true;
  }

  bool FlushResampler(PcmBuffer* out, std::string* error) {
    while (true) {
      int pending = static_cast<int>(
          av_rescale_rnd(swr_get_delay(swr_ctx_, codec_ctx_->sample_rate),
                         target_sample_rate_, codec_ctx_->sample_rate, AV_ROUND_UP));
      if (pending <= 0) return true;
      size_t offset = out->samples.size();
      out->samples.resize(offset + static_cast<size_t>(pending));
      auto* dst = reinterpret_cast<uint8_t*>(out->samples.data() + offset);
      int converted = swr_convert(swr_ctx_, &dst, pending, nullptr, 0);
      if (converted < 0) {
        out->samples.resize(offset);
        *error = "[AudioDecoder] Resampler flush failed: " + AvError(converted);
        return false;
      }
      out->samples.resize(offset + static_cast<size_t>(converted));
      if (converted == 0) return true;
    }
  }

  void Close() {
    if (swr_ctx_) swr_free(&swr_ctx_);
    if (frame_) av_frame_free(&frame_);
    if (packet_) av_packet_free(&packet_);
    if (codec_ctx_) avcodec_free_context(&codec_ctx_);
    if (format_ctx_) avformat_close_input(&format_ctx_);
    if (avio_ctx_) {
      av_freep(&avio_ctx_->buffer);
      avio_context_free(&avio_ctx_);
    }
  }

  int target_sample_rate_;
  MemoryCursor cursor_;
  AVIOContext* avio_ctx_ = nullptr;
  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  int stream_index_ = -1;
};

}  // namespace

AudioDecoder::AudioDecoder(int target_sample_rate) : target_sample_rate_(target_sample_rate) {}

bool AudioDecoder::DecodeMemory(const std::vector<uint8_t>& bytes, PcmBuffer* out,
                                std::string* error) const {
  DecodeSession session(target_sample_rate_);
  if (!session.OpenMemory(bytes, error)) return false;
  return session.DecodeAll(out, error);
}

bool AudioDecoder::DecodeFile(const std::string& path, PcmBuffer* out,
                              std::string* error) const {
  DecodeSession session(target_sample_rate_);
  if (!session.OpenFile(path, error)) return false;
  return session.DecodeAll(out, error);
}

}  // namespace narrovault::audio
