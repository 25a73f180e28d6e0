#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace voice_capture_cpp
{

/// 캡처 장치가 전달하는 원본 바이트 블록 (순서대로 이어 붙여 최종 payload 구성)
using AudioChunk = std::vector<uint8_t>;

/// PortAudio 캡처가 만드는 raw payload의 미디어 타입 (interleaved float32 little-endian)
constexpr const char * kMediaTypePcmF32 = "audio/pcm-f32le";

struct AudioPayload
{
  std::vector<uint8_t> data;
  // 비어 있으면 WAV로 간주
  std::string media_type;

  bool empty() const { return data.empty(); }
};

/// 채널별 float PCM 샘플 (값 범위 [-1.0, 1.0])
struct RawAudioBuffer
{
  uint32_t sample_rate = 16000;
  std::vector<std::vector<float>> channels;

  size_t channel_count() const { return channels.size(); }
  size_t sample_count() const { return channels.empty() ? 0 : channels.front().size(); }
};

}  // namespace voice_capture_cpp
