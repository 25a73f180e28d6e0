#pragma once

#include <atomic>
#include <memory>

namespace voice_feature_cpp
{

/// 업로드 취소 신호. 재시도 사이와 전송 중(cURL progress 콜백)에 확인됨
class CancelToken
{
public:
  CancelToken()
  : cancelled_(false)
  {
  }

  void cancel() { cancelled_.store(true); }
  bool is_cancelled() const { return cancelled_.load(); }
  const std::atomic<bool> & flag() const { return cancelled_; }

private:
  std::atomic<bool> cancelled_;
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

}  // namespace voice_feature_cpp
