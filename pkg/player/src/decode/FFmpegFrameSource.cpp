// Repository: Vidmark-player
// Component: FFmpeg Frame Source
// Purpose: Index-addressed RGB24 video decoding using libavformat/libavcodec.
// Copyright (c) 2025 Vidmark

#include "vidmark/decode/FFmpegFrameSource.h"

#include <cerrno>
#include <chrono>
#include <cmath>
#include <sstream>

#include "vidmark/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/hwcontext.h>
#include <libavutil/log.h>  // For av_log_set_level
#include <libswscale/swscale.h>
}

namespace {

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

// get_format callback: pick the hardware surface format negotiated in
// InitializeHwAccel(), falling back to FFmpeg's software choice.
AVPixelFormat SelectHwFormat(AVCodecContext* ctx, const AVPixelFormat* fmts) {
  const int* wanted = static_cast<const int*>(ctx->opaque);
  for (const AVPixelFormat* p = fmts; *p != AV_PIX_FMT_NONE; ++p) {
    if (wanted && *p == *wanted) return *p;
  }
  return avcodec_default_get_format(ctx, fmts);
}

}  // namespace

namespace vidmark::decode {

using playback::DecodeStatus;
using playback::PlaybackError;
using vidmark::util::Logger;

DecoderConfig DecoderConfig::FromEngineConfig(
    const playback::EngineConfig& config) {
  DecoderConfig c;
  c.target_width = config.output_width;
  c.target_height = config.output_height;
  c.hw_accel_enabled = config.enable_hw_accel;
  c.max_decode_threads = config.max_decode_threads;
  return c;
}

FFmpegFrameSource::FFmpegFrameSource(const DecoderConfig& config)
    : config_(config) {}

FFmpegFrameSource::~FFmpegFrameSource() {
  Close();
}

PlaybackError FFmpegFrameSource::Open(const std::string& path,
                                      playback::SourceInfo& info) {
  Close();
  path_ = path;
  Logger::Info("[FFmpegFrameSource] Opening: " + path);

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  // Open input file (DECODER_STEP: open_input)
  int ret = avformat_open_input(&format_ctx_, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FFmpegFrameSource] DECODER_STEP open_input FAILED uri=" << path
        << " ret=" << ret << " err=" << AvError(ret);
    Logger::Error(oss.str());
    format_ctx_ = nullptr;
    return ret == AVERROR(ENOENT) ? PlaybackError::kSourceNotFound
                                  : PlaybackError::kSourceUnreadable;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FFmpegFrameSource] DECODER_STEP avformat_find_stream_info FAILED uri="
        << path << " ret=" << ret << " err=" << AvError(ret);
    Logger::Error(oss.str());
    Close();
    return PlaybackError::kSourceUnreadable;
  }

  if (!FindVideoStream()) {
    Logger::Error("[FFmpegFrameSource] DECODER_STEP find_video_stream FAILED uri=" +
                  path + " (no video stream with a usable frame rate)");
    Close();
    return PlaybackError::kSourceUnreadable;
  }

  if (!InitializeCodec()) {
    Logger::Error("[FFmpegFrameSource] DECODER_STEP initialize_codec FAILED uri=" +
                  path);
    Close();
    return PlaybackError::kSourceUnreadable;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    Logger::Error("[FFmpegFrameSource] DECODER_STEP packet_alloc FAILED uri=" +
                  path);
    Close();
    return PlaybackError::kSourceUnreadable;
  }

  info.frame_rate = frame_rate_;
  info.total_frames = EstimateTotalFrames();
  OutputSize(GetVideoWidth(), GetVideoHeight(), info.width, info.height);
  next_index_ = 0;

  std::ostringstream oss;
  oss << "[FFmpegFrameSource] DECODER_STEP open_input OK uri=" << path << " "
      << GetVideoWidth() << "x" << GetVideoHeight() << " @ " << frame_rate_
      << " fps frames=" << info.total_frames
      << " hw=" << (HwAccelActive() ? "on" : "off");
  Logger::Info(oss.str());
  return PlaybackError::kNone;
}

void FFmpegFrameSource::Close() {
  if (format_ctx_) {
    Logger::Info("[FFmpegFrameSource] Closing decoder uri=" + path_);
  }

  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (sw_frame_) {
    av_frame_free(&sw_frame_);
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (hw_device_ctx_) {
    av_buffer_unref(&hw_device_ctx_);
  }
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }

  decoded_ = nullptr;
  video_stream_index_ = -1;
  hw_pix_fmt_ = -1;
  frame_rate_ = 0.0;
  next_index_ = -1;
  draining_ = false;
  eof_reached_ = false;
}

DecodeStatus FFmpegFrameSource::Decode(int64_t index, bool sequential_hint,
                                       playback::VideoFrame& out) {
  if (!IsOpen() || index < 0) {
    return DecodeStatus::kDecodeFailed;
  }

  auto start_time = std::chrono::steady_clock::now();

  if (sequential_hint && index == next_index_) {
    DecodeStatus status = ReadAndDecodeFrame();
    if (status != DecodeStatus::kOk) {
      next_index_ = -1;
      return status;
    }
    stats_.sequential_reads++;
  } else {
    if (!SeekToIndex(index)) {
      stats_.decode_errors++;
      next_index_ = -1;
      return DecodeStatus::kDecodeFailed;
    }
    stats_.seeks++;

    // Preroll: decode forward from the keyframe to the requested index.
    while (true) {
      DecodeStatus status = ReadAndDecodeFrame();
      if (status != DecodeStatus::kOk) {
        next_index_ = -1;
        return status;
      }
      const int64_t got = FrameIndexOf(decoded_);
      if (got < 0 || got >= index) break;
      stats_.preroll_frames_discarded++;
    }
  }

  if (!ConvertFrame(decoded_, out)) {
    stats_.decode_errors++;
    next_index_ = -1;
    return DecodeStatus::kDecodeFailed;
  }
  next_index_ = index + 1;

  UpdateStats(std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now() - start_time).count());
  return DecodeStatus::kOk;
}

int FFmpegFrameSource::GetVideoWidth() const {
  if (!codec_ctx_) return 0;
  return codec_ctx_->width;
}

int FFmpegFrameSource::GetVideoHeight() const {
  if (!codec_ctx_) return 0;
  return codec_ctx_->height;
}

bool FFmpegFrameSource::FindVideoStream() {
  int index = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1,
                                  nullptr, 0);
  if (index < 0) return false;

  AVStream* stream = format_ctx_->streams[index];
  AVRational fps = stream->avg_frame_rate;
  if (fps.num <= 0 || fps.den <= 0) fps = stream->r_frame_rate;
  if (fps.num <= 0 || fps.den <= 0) return false;

  video_stream_index_ = index;
  frame_rate_ = av_q2d(fps);
  time_base_ = av_q2d(stream->time_base);
  start_time_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
  return true;
}

bool FFmpegFrameSource::InitializeCodec() {
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  AVCodecParameters* codecpar = stream->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    std::ostringstream oss;
    oss << "[FFmpegFrameSource] Codec not found: " << codecpar->codec_id;
    Logger::Error(oss.str());
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Logger::Error("[FFmpegFrameSource] Failed to allocate codec context");
    return false;
  }

  if (avcodec_parameters_to_context(codec_ctx_, codecpar) < 0) {
    Logger::Error("[FFmpegFrameSource] Failed to copy codec parameters");
    return false;
  }

  if (config_.max_decode_threads > 0) {
    codec_ctx_->thread_count = config_.max_decode_threads;
  }
  codec_ctx_->thread_type = FF_THREAD_FRAME;

  if (config_.hw_accel_enabled && !InitializeHwAccel(codec)) {
    Logger::Warn("[FFmpegFrameSource] Hardware decode unavailable, using software");
  }

  int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegFrameSource] Failed to open codec: " + AvError(ret));
    return false;
  }

  frame_ = av_frame_alloc();
  sw_frame_ = av_frame_alloc();
  if (!frame_ || !sw_frame_) {
    Logger::Error("[FFmpegFrameSource] Failed to allocate frames");
    return false;
  }
  return true;
}

bool FFmpegFrameSource::InitializeHwAccel(const AVCodec* codec) {
  for (int i = 0;; ++i) {
    const AVCodecHWConfig* hw = avcodec_get_hw_config(codec, i);
    if (!hw) return false;
    if (!(hw->methods & AV_CODEC_HW_CONFIG_METHOD_HW_DEVICE_CTX)) continue;

    AVBufferRef* device = nullptr;
    int ret = av_hwdevice_ctx_create(&device, hw->device_type, nullptr, nullptr, 0);
    if (ret < 0) {
      std::ostringstream oss;
      oss << "[FFmpegFrameSource] av_hwdevice_ctx_create("
          << av_hwdevice_get_type_name(hw->device_type)
          << ") failed: " << AvError(ret);
      Logger::Debug(oss.str());
      continue;
    }

    hw_device_ctx_ = device;
    hw_pix_fmt_ = hw->pix_fmt;
    codec_ctx_->hw_device_ctx = av_buffer_ref(hw_device_ctx_);
    codec_ctx_->opaque = &hw_pix_fmt_;
    codec_ctx_->get_format = SelectHwFormat;
    Logger::Info(std::string("[FFmpegFrameSource] Hardware decode device: ") +
                 av_hwdevice_get_type_name(hw->device_type));
    return true;
  }
}

bool FFmpegFrameSource::InitializeScaler(int src_width, int src_height,
                                         int src_format) {
  int dst_width = 0;
  int dst_height = 0;
  OutputSize(src_width, src_height, dst_width, dst_height);

  sws_ctx_ = sws_getCachedContext(
      sws_ctx_,
      src_width, src_height, static_cast<AVPixelFormat>(src_format),
      dst_width, dst_height, AV_PIX_FMT_RGB24,
      SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    Logger::Error("[FFmpegFrameSource] Failed to create scaler context");
    return false;
  }
  return true;
}

bool FFmpegFrameSource::SeekToIndex(int64_t index) {
  const double seconds = static_cast<double>(index) / frame_rate_;
  const int64_t timestamp =
      start_time_ + static_cast<int64_t>(std::llround(seconds / time_base_));

  // Seek to keyframe before the target frame (DECODER_STEP: seek)
  int ret = av_seek_frame(format_ctx_, video_stream_index_, timestamp,
                          AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FFmpegFrameSource] DECODER_STEP seek FAILED index=" << index
        << " ret=" << ret << " err=" << AvError(ret);
    Logger::Error(oss.str());
    return false;
  }

  avcodec_flush_buffers(codec_ctx_);
  draining_ = false;
  eof_reached_ = false;
  return true;
}

DecodeStatus FFmpegFrameSource::ReadAndDecodeFrame() {
  decoded_ = nullptr;
  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == 0) break;
    if (ret == AVERROR_EOF) {
      eof_reached_ = true;
      return DecodeStatus::kEndOfStream;
    }
    if (ret != AVERROR(EAGAIN)) {
      stats_.decode_errors++;
      Logger::Warn("[FFmpegFrameSource] avcodec_receive_frame: " + AvError(ret));
      return DecodeStatus::kDecodeFailed;
    }

    ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      // Drain pictures still held by the decoder.
      if (draining_) {
        eof_reached_ = true;
        return DecodeStatus::kEndOfStream;
      }
      draining_ = true;
      ret = avcodec_send_packet(codec_ctx_, nullptr);
      if (ret < 0 && ret != AVERROR_EOF) {
        stats_.decode_errors++;
        Logger::Warn("[FFmpegFrameSource] flush packet: " + AvError(ret));
        return DecodeStatus::kDecodeFailed;
      }
      continue;
    }
    if (ret < 0) {
      stats_.decode_errors++;
      Logger::Warn("[FFmpegFrameSource] av_read_frame: " + AvError(ret));
      return DecodeStatus::kDecodeFailed;
    }

    if (packet_->stream_index != video_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }

    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      stats_.decode_errors++;
      Logger::Warn("[FFmpegFrameSource] avcodec_send_packet: " + AvError(ret));
      return DecodeStatus::kDecodeFailed;
    }
  }

  if (hw_pix_fmt_ >= 0 && frame_->format == hw_pix_fmt_) {
    // av_hwframe_transfer_data copies from GPU to CPU
    av_frame_unref(sw_frame_);
    int ret = av_hwframe_transfer_data(sw_frame_, frame_, 0);
    if (ret < 0) {
      stats_.decode_errors++;
      Logger::Warn("[FFmpegFrameSource] av_hwframe_transfer_data: " + AvError(ret));
      return DecodeStatus::kDecodeFailed;
    }
    sw_frame_->pts = frame_->pts;
    sw_frame_->best_effort_timestamp = frame_->best_effort_timestamp;
    decoded_ = sw_frame_;
  } else {
    decoded_ = frame_;
  }
  return DecodeStatus::kOk;
}

bool FFmpegFrameSource::ConvertFrame(AVFrame* av_frame,
                                     playback::VideoFrame& out) {
  if (!av_frame) return false;
  if (!InitializeScaler(av_frame->width, av_frame->height, av_frame->format)) {
    return false;
  }

  int dst_width = 0;
  int dst_height = 0;
  OutputSize(av_frame->width, av_frame->height, dst_width, dst_height);

  out.width = dst_width;
  out.height = dst_height;
  out.data.resize(static_cast<size_t>(dst_width) * dst_height * 3);

  uint8_t* dst_data[4] = {out.data.data(), nullptr, nullptr, nullptr};
  int dst_linesize[4] = {dst_width * 3, 0, 0, 0};
  int rows = sws_scale(sws_ctx_, av_frame->data, av_frame->linesize, 0,
                       av_frame->height, dst_data, dst_linesize);
  if (rows <= 0) {
    Logger::Warn("[FFmpegFrameSource] sws_scale produced no rows");
    return false;
  }

  int64_t pts = av_frame->best_effort_timestamp != AV_NOPTS_VALUE
      ? av_frame->best_effort_timestamp
      : av_frame->pts;
  out.pts_us = (pts != AV_NOPTS_VALUE)
      ? static_cast<int64_t>((pts - start_time_) * time_base_ * 1'000'000.0)
      : 0;
  return true;
}

int64_t FFmpegFrameSource::FrameIndexOf(const AVFrame* av_frame) const {
  int64_t pts = av_frame->best_effort_timestamp != AV_NOPTS_VALUE
      ? av_frame->best_effort_timestamp
      : av_frame->pts;
  if (pts == AV_NOPTS_VALUE) return -1;
  const double seconds = static_cast<double>(pts - start_time_) * time_base_;
  return static_cast<int64_t>(std::llround(seconds * frame_rate_));
}

int64_t FFmpegFrameSource::EstimateTotalFrames() const {
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  if (stream->nb_frames > 0) return stream->nb_frames;

  double seconds = 0.0;
  if (stream->duration != AV_NOPTS_VALUE) {
    seconds = static_cast<double>(stream->duration) * time_base_;
  } else if (format_ctx_->duration != AV_NOPTS_VALUE) {
    seconds = static_cast<double>(format_ctx_->duration) / AV_TIME_BASE;
  }
  return static_cast<int64_t>(std::llround(seconds * frame_rate_));
}

void FFmpegFrameSource::OutputSize(int src_width, int src_height,
                                   int& dst_width, int& dst_height) const {
  dst_width = config_.target_width;
  dst_height = config_.target_height;
  if (dst_width <= 0 && dst_height <= 0) {
    dst_width = src_width;
    dst_height = src_height;
  } else if (dst_width <= 0 && src_height > 0) {
    dst_width = static_cast<int>(
        std::lround(static_cast<double>(src_width) * dst_height / src_height));
  } else if (dst_height <= 0 && src_width > 0) {
    dst_height = static_cast<int>(
        std::lround(static_cast<double>(src_height) * dst_width / src_width));
  }
}

void FFmpegFrameSource::UpdateStats(double decode_time_ms) {
  stats_.frames_decoded++;

  // Exponential moving average
  const double alpha = 0.1;
  stats_.average_decode_time_ms =
      alpha * decode_time_ms + (1.0 - alpha) * stats_.average_decode_time_ms;
}

}  // namespace vidmark::decode
