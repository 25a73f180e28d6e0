#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "voice_capture_cpp/audio_payload.hpp"

namespace voice_capture_cpp
{

constexpr size_t kWavHeaderSize = 44;

struct WavHeaderInfo
{
  uint32_t riff_size = 0;
  uint16_t format_code = 0;
  uint16_t channels = 0;
  uint32_t sample_rate = 0;
  uint32_t byte_rate = 0;
  uint16_t block_align = 0;
  uint16_t bits_per_sample = 0;
  uint32_t data_size = 0;

  uint32_t sample_count() const { return block_align == 0 ? 0 : data_size / block_align; }
};

/// RawAudioBuffer → 44바이트 헤더 + 16bit PCM little-endian WAV 바이트열
/// 0번 채널만 인코딩하며 헤더의 채널 수/블록 정렬은 입력 버퍼 기준으로 기록
class WavEncoder
{
public:
  WavEncoder();

  std::vector<uint8_t> encode(const RawAudioBuffer & buffer) const;

  /// 음수는 0x8000, 0 이상은 0x7FFF 배율. 범위 밖 값은 [-1, 1]로 clamp, NaN은 0
  static int16_t quantize(float sample);
};

/// 전송 전 WAV 컨테이너 검증 (RIFF/WAVE/fmt 태그, PCM 포맷 코드)
class WavValidator
{
public:
  WavValidator();

  bool validate(const std::vector<uint8_t> & bytes) const;
  bool validate_file(const std::string & file_path) const;
  bool parse_header(const std::vector<uint8_t> & bytes, WavHeaderInfo & out) const;
};

/// 캡처 장치의 interleaved float32 LE 바이트열을 채널별 RawAudioBuffer로 복원
bool decode_pcm_f32le(
  const std::vector<uint8_t> & bytes,
  uint32_t sample_rate,
  uint16_t channels,
  RawAudioBuffer & out);

}  // namespace voice_capture_cpp
