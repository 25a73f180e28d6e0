#include "voice_capture_cpp/tick_timer.hpp"

#include <utility>

using namespace std;


namespace voice_capture_cpp
{

SteadyTickTimer::SteadyTickTimer()
: worker_id_(thread::id()), active_(false), cancelled_(false)
{
}

SteadyTickTimer::~SteadyTickTimer()
{
  cancel();
  if (on_worker_thread()) {
    // 타이머 스레드 안에서 소멸되는 경우
    lock_guard<mutex> lock(join_mutex_);
    if (worker_.joinable()) {
      worker_.detach();
    }
  }
}

bool SteadyTickTimer::start(chrono::milliseconds period, TickCallback callback)
{
  if (active_.load() || period.count() <= 0 || !callback) {
    return false;
  }
  if (on_worker_thread()) {
    return false;
  }

  lock_guard<mutex> join_lock(join_mutex_);
  if (worker_.joinable()) {
    worker_.join();
    worker_id_.store(thread::id());
  }
  {
    lock_guard<mutex> lock(mutex_);
    cancelled_ = false;
  }
  active_.store(true);
  worker_ = thread(&SteadyTickTimer::run, this, period, move(callback));
  return true;
}

void SteadyTickTimer::cancel()
{
  {
    lock_guard<mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
  if (!on_worker_thread()) {
    join_previous();
  }
  active_.store(false);
}

bool SteadyTickTimer::is_active() const
{
  return active_.load();
}

bool SteadyTickTimer::on_worker_thread() const
{
  return worker_id_.load() == this_thread::get_id();
}

void SteadyTickTimer::join_previous()
{
  lock_guard<mutex> lock(join_mutex_);
  if (worker_.joinable()) {
    worker_.join();
    worker_id_.store(thread::id());
  }
}

/// 누적 오차 없이 start 시점 기준 period 배수마다 콜백 호출
void SteadyTickTimer::run(chrono::milliseconds period, TickCallback callback)
{
  worker_id_.store(this_thread::get_id());
  auto next = chrono::steady_clock::now() + period;
  while (true) {
    {
      unique_lock<mutex> lock(mutex_);
      if (cv_.wait_until(lock, next, [this]() { return cancelled_; })) {
        break;
      }
    }
    callback();
    next += period;
  }
  active_.store(false);
}

}  // namespace voice_capture_cpp
