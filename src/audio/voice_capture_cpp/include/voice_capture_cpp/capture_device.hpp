#pragma once

#include <functional>
#include <string>

#include "voice_capture_cpp/audio_payload.hpp"

namespace voice_capture_cpp
{

/// 마이크 장치 추상화. open 성공 후 close 전까지 chunk 콜백이 장치 스레드에서 호출됨
class CaptureDevice
{
public:
  using ChunkCallback = std::function<void(const AudioChunk & chunk)>;

  virtual ~CaptureDevice() = default;

  /// 권한 거부/장치 없음이면 false + last_error() 설정
  virtual bool open(ChunkCallback callback) = 0;
  /// 스트림 정지 및 장치 핸들 해제. 열려 있지 않으면 아무 것도 하지 않음
  virtual void close() = 0;
  virtual bool is_open() const = 0;
  virtual std::string media_type() const = 0;
  virtual std::string last_error() const = 0;
};

}  // namespace voice_capture_cpp
