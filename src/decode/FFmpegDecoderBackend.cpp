// Repository: Retrovue-vinefeed
// Component: FFmpeg Decoder Backend Implementation
// Purpose: Source open, probe, codec open and first-frame decode.
// Copyright (c) 2025 RetroVue

#include "vinefeed/decode/FFmpegDecoderBackend.hpp"

#include <cerrno>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "vinefeed/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
}

namespace vinefeed::decode {

using resource::ResourceError;
using vinefeed::util::Logger;

namespace {

// FFmpeg interrupt callback: return non-zero to abort I/O.
int InterruptCallback(void* opaque) {
  auto* token = static_cast<const CancelToken*>(opaque);
  return token->IsCancelled() ? 1 : 0;
}

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return std::string(errbuf);
}

struct FrameDeleter {
  void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};

struct PacketDeleter {
  void operator()(AVPacket* packet) const { av_packet_free(&packet); }
};

using AVFramePtr = std::unique_ptr<AVFrame, FrameDeleter>;
using AVPacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;

// Owns the demuxer, the decoder and the first decoded frame.  Destroying it
// closes the input and frees every context.
class FFmpegPlaybackHandle : public IPlaybackHandle {
 public:
  explicit FFmpegPlaybackHandle(CancelToken cancel)
      : cancel_(std::make_unique<CancelToken>(std::move(cancel))) {}

  ~FFmpegPlaybackHandle() override {
    if (codec_ctx_) {
      avcodec_free_context(&codec_ctx_);
    }
    if (format_ctx_) {
      avformat_close_input(&format_ctx_);
    }
  }

  FFmpegPlaybackHandle(const FFmpegPlaybackHandle&) = delete;
  FFmpegPlaybackHandle& operator=(const FFmpegPlaybackHandle&) = delete;

  bool Play() override {
    if (!format_ctx_) return false;
    const int ret = av_read_play(format_ctx_);
    // Local files do not implement play/pause; that is not a refusal.
    if (ret < 0 && ret != AVERROR(ENOSYS)) {
      Logger::Warn("[FFmpegDecoderBackend] PLAY FAILED err=" + AvErrorString(ret));
      return false;
    }
    playing_ = true;
    return true;
  }

  bool Pause() override {
    if (!format_ctx_) return false;
    const int ret = av_read_pause(format_ctx_);
    if (ret < 0 && ret != AVERROR(ENOSYS)) {
      Logger::Warn("[FFmpegDecoderBackend] PAUSE FAILED err=" + AvErrorString(ret));
      return false;
    }
    playing_ = false;
    return true;
  }

  bool IsPlaying() const override { return playing_; }

  // Heap-allocated so the interrupt callback's opaque pointer stays valid
  // for the lifetime of the format context.
  const CancelToken* cancel() const { return cancel_.get(); }

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFramePtr first_frame_;
  int video_stream_index_ = -1;

 private:
  std::unique_ptr<CancelToken> cancel_;
  bool playing_ = false;
};

WarmupResult CancelledOr(const CancelToken& cancel, ResourceError error,
                         const std::string& message) {
  if (cancel.IsCancelled()) {
    return WarmupResult::Failure(ResourceError::kCancelled, "cancelled: " + message);
  }
  return WarmupResult::Failure(error, message);
}

}  // namespace

FFmpegDecoderBackend::FFmpegDecoderBackend(FFmpegBackendConfig config)
    : config_(config) {
  if (config_.quiet_ffmpeg_log) {
    // Suppress FFmpeg warnings but keep errors visible
    av_log_set_level(AV_LOG_ERROR);
  }
  avformat_network_init();
}

WarmupResult FFmpegDecoderBackend::Warmup(const resource::VideoDescriptor& descriptor,
                                          const CancelToken& cancel) {
  const std::string& uri = descriptor.source_uri;
  if (uri.empty()) {
    return WarmupResult::Failure(ResourceError::kSourceUnavailable, "empty source uri");
  }

  auto handle = std::make_unique<FFmpegPlaybackHandle>(cancel);

  // DECODER_STEP: alloc_context
  handle->format_ctx_ = avformat_alloc_context();
  if (!handle->format_ctx_) {
    return WarmupResult::Failure(ResourceError::kDecodeFailure,
                                 "failed to allocate format context");
  }
  handle->format_ctx_->interrupt_callback.callback = InterruptCallback;
  handle->format_ctx_->interrupt_callback.opaque =
      const_cast<CancelToken*>(handle->cancel());

  // DECODER_STEP: open_input (frees and nulls the context on failure)
  int ret = avformat_open_input(&handle->format_ctx_, uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    const std::string err = AvErrorString(ret);
    std::ostringstream oss;
    oss << "[FFmpegDecoderBackend] DECODER_STEP open_input FAILED video_id=" << descriptor.id
        << " uri=" << uri << " ret=" << ret << " err=" << err;
    Logger::Warn(oss.str());
    return CancelledOr(cancel, ResourceError::kSourceUnavailable, "open_input: " + err);
  }

  // DECODER_STEP: find_stream_info
  ret = avformat_find_stream_info(handle->format_ctx_, nullptr);
  if (ret < 0) {
    const std::string err = AvErrorString(ret);
    std::ostringstream oss;
    oss << "[FFmpegDecoderBackend] DECODER_STEP find_stream_info FAILED video_id="
        << descriptor.id << " ret=" << ret << " err=" << err;
    Logger::Warn(oss.str());
    return CancelledOr(cancel, ResourceError::kDecodeFailure, "find_stream_info: " + err);
  }

  // DECODER_STEP: find_video_stream
  for (unsigned int i = 0; i < handle->format_ctx_->nb_streams; ++i) {
    if (handle->format_ctx_->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
      handle->video_stream_index_ = static_cast<int>(i);
      break;
    }
  }
  if (handle->video_stream_index_ < 0) {
    Logger::Warn("[FFmpegDecoderBackend] DECODER_STEP find_video_stream FAILED video_id=" +
                 descriptor.id + " (no video stream)");
    return WarmupResult::Failure(ResourceError::kDecodeFailure, "no video stream");
  }

  // DECODER_STEP: initialize_codec
  const AVCodecParameters* codecpar =
      handle->format_ctx_->streams[handle->video_stream_index_]->codecpar;
  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    Logger::Warn("[FFmpegDecoderBackend] DECODER_STEP initialize_codec FAILED video_id=" +
                 descriptor.id + " (no decoder)");
    return WarmupResult::Failure(ResourceError::kDecodeFailure, "no decoder for codec");
  }
  handle->codec_ctx_ = avcodec_alloc_context3(codec);
  if (!handle->codec_ctx_) {
    return WarmupResult::Failure(ResourceError::kDecodeFailure,
                                 "failed to allocate codec context");
  }
  if (avcodec_parameters_to_context(handle->codec_ctx_, codecpar) < 0) {
    return WarmupResult::Failure(ResourceError::kDecodeFailure,
                                 "failed to copy codec parameters");
  }
  handle->codec_ctx_->thread_count = config_.max_decode_threads;
  ret = avcodec_open2(handle->codec_ctx_, codec, nullptr);
  if (ret < 0) {
    const std::string err = AvErrorString(ret);
    Logger::Warn("[FFmpegDecoderBackend] DECODER_STEP initialize_codec FAILED video_id=" +
                 descriptor.id + " err=" + err);
    return WarmupResult::Failure(ResourceError::kDecodeFailure, "avcodec_open2: " + err);
  }

  // DECODER_STEP: first_frame
  AVPacketPtr packet(av_packet_alloc());
  AVFramePtr frame(av_frame_alloc());
  if (!packet || !frame) {
    return WarmupResult::Failure(ResourceError::kDecodeFailure,
                                 "failed to allocate packet/frame");
  }

  bool got_frame = false;
  bool flushed = false;
  for (int read = 0; !got_frame && read < config_.max_probe_packets; ++read) {
    if (cancel.IsCancelled()) {
      return WarmupResult::Failure(ResourceError::kCancelled, "cancelled before first frame");
    }

    ret = av_read_frame(handle->format_ctx_, packet.get());
    if (ret == AVERROR_EOF) {
      ret = avcodec_send_packet(handle->codec_ctx_, nullptr);
      if (ret < 0 && ret != AVERROR_EOF) {
        return WarmupResult::Failure(ResourceError::kDecodeFailure,
                                     "flush: " + AvErrorString(ret));
      }
      flushed = true;
    } else if (ret < 0) {
      const std::string err = AvErrorString(ret);
      Logger::Warn("[FFmpegDecoderBackend] DECODER_STEP read_frame FAILED video_id=" +
                   descriptor.id + " err=" + err);
      return CancelledOr(cancel, ResourceError::kSourceUnavailable, "read_frame: " + err);
    } else if (packet->stream_index == handle->video_stream_index_) {
      ret = avcodec_send_packet(handle->codec_ctx_, packet.get());
      av_packet_unref(packet.get());
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        const std::string err = AvErrorString(ret);
        Logger::Warn("[FFmpegDecoderBackend] DECODER_STEP send_packet FAILED video_id=" +
                     descriptor.id + " err=" + err);
        return WarmupResult::Failure(ResourceError::kDecodeFailure, "send_packet: " + err);
      }
    } else {
      av_packet_unref(packet.get());
      continue;
    }

    ret = avcodec_receive_frame(handle->codec_ctx_, frame.get());
    if (ret == 0) {
      got_frame = true;
    } else if (ret != AVERROR(EAGAIN)) {
      break;  // EOF after flush, or a decode error
    }
    if (flushed) break;
  }

  if (!got_frame) {
    Logger::Warn("[FFmpegDecoderBackend] DECODER_STEP first_frame FAILED video_id=" +
                 descriptor.id);
    return CancelledOr(cancel, ResourceError::kDecodeFailure, "no decodable frame");
  }
  handle->first_frame_ = std::move(frame);

  std::ostringstream oss;
  oss << "[FFmpegDecoderBackend] WARMED video_id=" << descriptor.id
      << " codec=" << codec->name << " width=" << handle->codec_ctx_->width
      << " height=" << handle->codec_ctx_->height;
  Logger::Info(oss.str());

  return WarmupResult::Success(std::move(handle));
}

}  // namespace vinefeed::decode
