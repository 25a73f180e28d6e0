#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include <portaudio.h>

#include "voice_capture_cpp/capture_device.hpp"

namespace voice_capture_cpp
{

/// PortAudio 입력 스트림 (float32, callback 모드)
/// 콜백마다 받은 프레임을 interleaved float32 LE 바이트 chunk로 전달
class PortAudioCapture : public CaptureDevice
{
public:
  PortAudioCapture();
  ~PortAudioCapture() override;

  PortAudioCapture(const PortAudioCapture &) = delete;
  PortAudioCapture & operator=(const PortAudioCapture &) = delete;

  bool configure(int device_index, int sample_rate, int channels, int frames_per_chunk);

  bool open(ChunkCallback callback) override;
  void close() override;
  bool is_open() const override;
  std::string media_type() const override;
  std::string last_error() const override;

  int sample_rate() const;
  int channels() const;
  int selected_device_index() const;
  std::string selected_device_name() const;

private:
  static int pa_callback(const void * input,
                         void * output,
                         unsigned long frameCount,
                         const PaStreamCallbackTimeInfo * timeInfo,
                         PaStreamCallbackFlags statusFlags,
                         void * userData);

  int resolve_device_index_() const;

  int device_index_;
  int sample_rate_;
  int channels_;
  int frames_per_chunk_;
  int selected_device_index_;
  std::string selected_device_name_;
  std::string last_error_;

  std::atomic<bool> running_;
  bool initialized_;
  PaStream * stream_;

  std::mutex cb_mutex_;
  ChunkCallback callback_;
};

}  // namespace voice_capture_cpp
