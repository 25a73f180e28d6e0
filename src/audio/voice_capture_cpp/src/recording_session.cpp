#include "voice_capture_cpp/recording_session.hpp"

#include <functional>
#include <utility>

using namespace std;


namespace voice_capture_cpp
{

RecordingSession::RecordingSession(
  CaptureDevice & device, TickTimer & timer, const SessionConfig & config)
: device_(device), timer_(timer), config_(config), elapsed_seconds_(0),
  accepting_chunks_(false), finalized_(false), device_held_(false), timer_running_(false)
{
}

RecordingSession::~RecordingSession()
{
  {
    lock_guard<mutex> lock(mutex_);
    finalized_ = true;
    accepting_chunks_ = false;
  }
  release_resources();
  // 자동 정지가 타이머 스레드에서 진행 중일 수 있으므로 스레드 종료까지 대기
  timer_.cancel();
}

void RecordingSession::set_raw_handler(RawHandler handler)
{
  raw_handler_ = move(handler);
}

void RecordingSession::set_analysis_handler(AnalysisHandler handler)
{
  analysis_handler_ = move(handler);
}

void RecordingSession::set_state_callback(StateCallback callback)
{
  state_callback_ = move(callback);
}

/// 마이크 획득 → RECORDING 전환 → 1초 tick 시작
/// 획득 실패 시 ERROR 상태로 남고 장치/타이머는 잡지 않음
bool RecordingSession::start()
{
  {
    lock_guard<mutex> lock(mutex_);
    if (state_machine_.state() != SessionState::IDLE) {
      last_error_ = "invalid_state:" + state_machine_.state_string();
      return false;
    }
    chunks_.clear();
    elapsed_seconds_ = 0;
    accepting_chunks_ = true;
  }

  if (!device_.open(bind(&RecordingSession::on_chunk, this, placeholders::_1))) {
    const string device_error = device_.last_error();
    {
      lock_guard<mutex> lock(mutex_);
      accepting_chunks_ = false;
      last_error_ = "permission_denied";
      if (!device_error.empty()) {
        last_error_ += ":" + device_error;
      }
      transition_locked(SessionState::ERROR);
    }
    notify_state(SessionState::ERROR);
    return false;
  }

  {
    lock_guard<mutex> lock(mutex_);
    device_held_ = true;
    timer_running_ = true;
    transition_locked(SessionState::RECORDING);
  }
  notify_state(SessionState::RECORDING);

  if (!timer_.start(config_.tick_period, bind(&RecordingSession::on_tick, this))) {
    {
      lock_guard<mutex> lock(mutex_);
      timer_running_ = false;
    }
    // 최대 녹음 시간을 보장할 수 없으므로 즉시 마무리
    stop();
    lock_guard<mutex> lock(mutex_);
    last_error_ = "tick_timer_start_failed";
    return false;
  }
  return true;
}

void RecordingSession::stop()
{
  {
    lock_guard<mutex> lock(mutex_);
    if (finalized_ || state_machine_.state() != SessionState::RECORDING) {
      return;
    }
    finalized_ = true;
    accepting_chunks_ = false;
    transition_locked(SessionState::STOPPING);
  }
  notify_state(SessionState::STOPPING);

  release_resources();

  AudioPayload payload;
  payload.media_type = device_.media_type();
  {
    lock_guard<mutex> lock(mutex_);
    size_t total = 0;
    for (const auto & chunk : chunks_) {
      total += chunk.size();
    }
    payload.data.reserve(total);
    for (const auto & chunk : chunks_) {
      payload.data.insert(payload.data.end(), chunk.begin(), chunk.end());
    }
    transition_locked(SessionState::FINISHED);
  }
  notify_state(SessionState::FINISHED);

  // chunk가 하나도 없으면 어느 경로도 호출하지 않음
  if (!payload.empty()) {
    deliver(payload);
  }
}

SessionState RecordingSession::state() const
{
  lock_guard<mutex> lock(mutex_);
  return state_machine_.state();
}

string RecordingSession::state_string() const
{
  lock_guard<mutex> lock(mutex_);
  return state_machine_.state_string();
}

int RecordingSession::elapsed_seconds() const
{
  lock_guard<mutex> lock(mutex_);
  return elapsed_seconds_;
}

size_t RecordingSession::chunk_count() const
{
  lock_guard<mutex> lock(mutex_);
  return chunks_.size();
}

string RecordingSession::last_error() const
{
  lock_guard<mutex> lock(mutex_);
  return last_error_;
}

/// 장치 스레드에서 호출됨. 정지 이후 도착한 chunk와 빈 chunk는 버림
void RecordingSession::on_chunk(const AudioChunk & chunk)
{
  if (chunk.empty()) {
    return;
  }
  lock_guard<mutex> lock(mutex_);
  if (!accepting_chunks_ || finalized_) {
    return;
  }
  chunks_.push_back(chunk);
}

/// 타이머 스레드에서 호출됨. 상한 도달 시 수동 정지와 같은 stop() 경로 사용
void RecordingSession::on_tick()
{
  bool reached = false;
  {
    lock_guard<mutex> lock(mutex_);
    if (finalized_ || state_machine_.state() != SessionState::RECORDING) {
      return;
    }
    ++elapsed_seconds_;
    reached = elapsed_seconds_ >= config_.max_record_seconds;
  }
  if (reached) {
    stop();
  }
}

bool RecordingSession::transition_locked(SessionState next)
{
  return state_machine_.transition_to(next);
}

void RecordingSession::notify_state(SessionState state)
{
  if (state_callback_) {
    state_callback_(state);
  }
}

/// 장치 해제와 타이머 취소는 각각 정확히 한 번만 수행
void RecordingSession::release_resources()
{
  bool cancel_timer = false;
  bool close_device = false;
  {
    lock_guard<mutex> lock(mutex_);
    cancel_timer = timer_running_;
    close_device = device_held_;
    timer_running_ = false;
    device_held_ = false;
  }
  if (cancel_timer) {
    timer_.cancel();
  }
  if (close_device) {
    device_.close();
  }
}

void RecordingSession::deliver(const AudioPayload & payload)
{
  if (config_.delivery == DeliveryPath::RAW) {
    if (raw_handler_) {
      raw_handler_(payload, config_.raw_filename);
      return;
    }
  } else if (analysis_handler_) {
    analysis_handler_(payload);
    return;
  }
  lock_guard<mutex> lock(mutex_);
  last_error_ = "no_handler_for_delivery_path";
}

}  // namespace voice_capture_cpp
