// Repository: Retrovue-vinefeed
// Component: FFmpeg Decoder Backend
// Purpose: IDecoderBackend over libavformat/libavcodec.  A warm-up opens the
//          source, probes it, opens the video codec and decodes the first
//          frame; the resulting handle keeps every context open for playback.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_DECODE_FFMPEG_DECODER_BACKEND_HPP_
#define VINEFEED_DECODE_FFMPEG_DECODER_BACKEND_HPP_

#include "vinefeed/decode/IDecoderBackend.hpp"

namespace vinefeed::decode {

struct FFmpegBackendConfig {
  int max_decode_threads = 1;     // 0 = let libavcodec decide
  int max_probe_packets = 256;    // Packets read while looking for the first frame
  bool quiet_ffmpeg_log = true;   // av_log level ERROR instead of the default
};

// Thread-safe: every Warmup() call builds its own contexts.  The cancel
// token is wired into the format context's interrupt callback, so blocking
// network I/O aborts as soon as the slot is evicted.
//
// Error mapping:
//   empty URI, open/read failure     → kSourceUnavailable
//   probe, no video stream, codec    → kDecodeFailure
//   token cancelled at any step      → kCancelled
class FFmpegDecoderBackend : public IDecoderBackend {
 public:
  explicit FFmpegDecoderBackend(FFmpegBackendConfig config = FFmpegBackendConfig());

  WarmupResult Warmup(const resource::VideoDescriptor& descriptor,
                      const CancelToken& cancel) override;

 private:
  FFmpegBackendConfig config_;
};

}  // namespace vinefeed::decode

#endif  // VINEFEED_DECODE_FFMPEG_DECODER_BACKEND_HPP_
