// Repository: Vidmark-player
// Component: FFmpeg Frame Source
// Purpose: Index-addressed RGB24 video decoding using libavformat/libavcodec.
// Copyright (c) 2025 Vidmark

#ifndef VIDMARK_DECODE_FFMPEG_FRAME_SOURCE_H_
#define VIDMARK_DECODE_FFMPEG_FRAME_SOURCE_H_

#include <cstdint>
#include <string>

#include "vidmark/playback/EngineConfig.hpp"
#include "vidmark/playback/IFrameSource.hpp"
#include "vidmark/playback/PlaybackTypes.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVCodec;
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct AVBufferRef;
struct SwsContext;

namespace vidmark::decode {

// DecoderConfig holds configuration for FFmpeg-based decoding.
struct DecoderConfig {
  int target_width;        // Output width, 0 = native
  int target_height;       // Output height, 0 = native
  bool hw_accel_enabled;   // Try a hardware decoder device first
  int max_decode_threads;  // Maximum decoder threads (0 = auto)

  DecoderConfig()
      : target_width(0),
        target_height(0),
        hw_accel_enabled(false),
        max_decode_threads(0) {}

  static DecoderConfig FromEngineConfig(const playback::EngineConfig& config);
};

// DecoderStats tracks decoding performance and errors.
struct DecoderStats {
  uint64_t frames_decoded;
  uint64_t sequential_reads;
  uint64_t seeks;
  uint64_t preroll_frames_discarded;
  uint64_t decode_errors;
  double average_decode_time_ms;

  DecoderStats()
      : frames_decoded(0),
        sequential_reads(0),
        seeks(0),
        preroll_frames_discarded(0),
        decode_errors(0),
        average_decode_time_ms(0.0) {}
};

// FFmpegFrameSource implements IFrameSource over one media file.
//
// Decode(index, sequential_hint):
// - hint set and index follows the last decode: read the next frame
// - otherwise: seek to the keyframe at or before index, flush, then decode
//   forward discarding frames until the one at index
//
// Frame index of a decoded picture is derived from its PTS:
//   round((pts - start_time) * time_base * fps)
//
// Output is packed RGB24 at native size or the configured target size (one
// zero dimension keeps aspect ratio).
//
// Thread Safety:
// - Not thread-safe; the playback engine serializes calls behind its
//   source lock.
//
// Error Handling:
// - Open: kSourceNotFound when the file cannot be found, kSourceUnreadable
//   for any other demux/codec failure. Every failing step is logged as
//   "DECODER_STEP <step> FAILED".
// - Decode: kEndOfStream once the demuxer and decoder are drained,
//   kDecodeFailed otherwise.
class FFmpegFrameSource : public playback::IFrameSource {
 public:
  explicit FFmpegFrameSource(const DecoderConfig& config = DecoderConfig());
  ~FFmpegFrameSource() override;

  FFmpegFrameSource(const FFmpegFrameSource&) = delete;
  FFmpegFrameSource& operator=(const FFmpegFrameSource&) = delete;

  playback::PlaybackError Open(const std::string& path,
                               playback::SourceInfo& info) override;
  playback::DecodeStatus Decode(int64_t index, bool sequential_hint,
                                playback::VideoFrame& out) override;
  void Close() override;
  bool IsOpen() const override { return format_ctx_ != nullptr; }

  const DecoderStats& GetStats() const { return stats_; }

  // True when frames come from a hardware device context.
  bool HwAccelActive() const { return hw_device_ctx_ != nullptr; }

  int GetVideoWidth() const;
  int GetVideoHeight() const;
  double GetFrameRate() const { return frame_rate_; }

 private:
  bool FindVideoStream();
  bool InitializeCodec();
  bool InitializeHwAccel(const AVCodec* codec);

  // Rebuilds the scaler when the decoded picture's size or format changes.
  bool InitializeScaler(int src_width, int src_height, int src_format);

  // Seeks to the keyframe at or before index and flushes the decoder.
  bool SeekToIndex(int64_t index);

  // Receives the next decoded picture into decoded_ (software memory).
  playback::DecodeStatus ReadAndDecodeFrame();

  bool ConvertFrame(AVFrame* av_frame, playback::VideoFrame& out);

  int64_t FrameIndexOf(const AVFrame* av_frame) const;
  int64_t EstimateTotalFrames() const;
  void OutputSize(int src_width, int src_height, int& dst_width,
                  int& dst_height) const;
  void UpdateStats(double decode_time_ms);

  DecoderConfig config_;
  DecoderStats stats_;
  std::string path_;

  // FFmpeg contexts (opaque pointers)
  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVBufferRef* hw_device_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVFrame* sw_frame_ = nullptr;
  AVFrame* decoded_ = nullptr;  // frame_ or sw_frame_, valid after a decode
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;

  int video_stream_index_ = -1;
  int hw_pix_fmt_ = -1;
  double frame_rate_ = 0.0;
  int64_t start_time_ = 0;
  double time_base_ = 0.0;

  // Index the next ReadAndDecodeFrame() yields when reading sequentially;
  // -1 when unknown (fresh open, failed decode).
  int64_t next_index_ = -1;
  bool draining_ = false;
  bool eof_reached_ = false;
};

}  // namespace vidmark::decode

#endif  // VIDMARK_DECODE_FFMPEG_FRAME_SOURCE_H_
