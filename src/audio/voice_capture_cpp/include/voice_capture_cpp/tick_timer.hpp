#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace voice_capture_cpp
{

class TickTimer
{
public:
  using TickCallback = std::function<void()>;

  virtual ~TickTimer() = default;

  virtual bool start(std::chrono::milliseconds period, TickCallback callback) = 0;
  /// 콜백 안에서 호출해도 안전해야 함 (자기 자신 join 금지)
  virtual void cancel() = 0;
  virtual bool is_active() const = 0;
};

/// steady_clock 기반 주기 타이머. 전용 스레드에서 period마다 콜백 호출
class SteadyTickTimer : public TickTimer
{
public:
  SteadyTickTimer();
  ~SteadyTickTimer() override;

  SteadyTickTimer(const SteadyTickTimer &) = delete;
  SteadyTickTimer & operator=(const SteadyTickTimer &) = delete;

  bool start(std::chrono::milliseconds period, TickCallback callback) override;
  void cancel() override;
  bool is_active() const override;

private:
  void run(std::chrono::milliseconds period, TickCallback callback);
  void join_previous();
  bool on_worker_thread() const;

  std::mutex mutex_;
  // worker_ 객체는 호출자 스레드에서만 접근 (join_mutex_ 보호). 타이머 스레드는 worker_id_만 사용
  std::mutex join_mutex_;
  std::condition_variable cv_;
  std::thread worker_;
  std::atomic<std::thread::id> worker_id_;
  std::atomic<bool> active_;
  bool cancelled_;
};

}  // namespace voice_capture_cpp
