#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "voice_capture_cpp/audio_payload.hpp"
#include "voice_capture_cpp/capture_device.hpp"
#include "voice_capture_cpp/state_machine.hpp"
#include "voice_capture_cpp/tick_timer.hpp"

namespace voice_capture_cpp
{

enum class DeliveryPath
{
  ANALYSIS,
  RAW
};

struct SessionConfig
{
  int max_record_seconds = 10;
  std::chrono::milliseconds tick_period{1000};
  DeliveryPath delivery = DeliveryPath::ANALYSIS;
  // RAW 경로에서 호출자가 지정하는 파일명 (확장자 포함)
  std::string raw_filename = "voice-recording.wav";
};

/// 녹음 1회를 담당하는 상태 머신
/// 마이크 장치를 단독 점유하고, 1초 tick으로 최대 녹음 시간을 강제하며,
/// 종료 시 chunk를 이어 붙인 payload를 RAW/ANALYSIS 중 정확히 한 경로로 넘긴다.
class RecordingSession
{
public:
  using RawHandler =
    std::function<void(const AudioPayload & payload, const std::string & filename)>;
  using AnalysisHandler = std::function<void(const AudioPayload & payload)>;
  using StateCallback = std::function<void(SessionState state)>;

  RecordingSession(CaptureDevice & device, TickTimer & timer, const SessionConfig & config);
  ~RecordingSession();

  RecordingSession(const RecordingSession &) = delete;
  RecordingSession & operator=(const RecordingSession &) = delete;

  void set_raw_handler(RawHandler handler);
  void set_analysis_handler(AnalysisHandler handler);
  void set_state_callback(StateCallback callback);

  bool start();
  /// 수동 정지와 자동 정지가 공유하는 경로. 여러 번 호출해도 한 번만 마무리됨
  void stop();

  SessionState state() const;
  std::string state_string() const;
  int elapsed_seconds() const;
  size_t chunk_count() const;
  std::string last_error() const;

private:
  void on_chunk(const AudioChunk & chunk);
  void on_tick();
  bool transition_locked(SessionState next);
  void notify_state(SessionState state);
  void release_resources();
  void deliver(const AudioPayload & payload);

  CaptureDevice & device_;
  TickTimer & timer_;
  SessionConfig config_;

  RawHandler raw_handler_;
  AnalysisHandler analysis_handler_;
  StateCallback state_callback_;

  mutable std::mutex mutex_;
  StateMachine state_machine_;
  std::vector<AudioChunk> chunks_;
  int elapsed_seconds_;
  bool accepting_chunks_;
  bool finalized_;
  bool device_held_;
  bool timer_running_;
  std::string last_error_;
};

}  // namespace voice_capture_cpp
