#include "voice_capture_cpp/wav_codec.hpp"

#include <cmath>
#include <cstring>
#include <fstream>
#include <ios>
#include <new>

using namespace std;


namespace voice_capture_cpp
{

namespace
{
constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kBitsPerSample = 16;
constexpr uint16_t kBytesPerSample = kBitsPerSample / 8;

void put_tag(vector<uint8_t> & out, size_t offset, const char * tag)
{
  memcpy(out.data() + offset, tag, 4);
}

void put_u16_le(vector<uint8_t> & out, size_t offset, uint16_t v)
{
  out[offset] = static_cast<uint8_t>(v & 0xFF);
  out[offset + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}

void put_u32_le(vector<uint8_t> & out, size_t offset, uint32_t v)
{
  out[offset] = static_cast<uint8_t>(v & 0xFF);
  out[offset + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  out[offset + 2] = static_cast<uint8_t>((v >> 16) & 0xFF);
  out[offset + 3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

uint16_t get_u16_le(const uint8_t * p)
{
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t get_u32_le(const uint8_t * p)
{
  return static_cast<uint32_t>(p[0]) |
         (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

bool has_tag(const uint8_t * p, const char * tag)
{
  return memcmp(p, tag, 4) == 0;
}

/// 오프셋 고정 44바이트 헤더 작성: RIFF@0 size@4 WAVE@8 fmt@12 ... data@36 size@40
vector<uint8_t> make_container(uint16_t channels, uint32_t sample_rate, size_t sample_count)
{
  const uint16_t block_align = static_cast<uint16_t>(channels * kBytesPerSample);
  const uint32_t byte_rate = sample_rate * block_align;
  const uint32_t data_size = static_cast<uint32_t>(sample_count * block_align);
  const uint32_t total_size = static_cast<uint32_t>(kWavHeaderSize) + data_size;

  vector<uint8_t> out(total_size, 0);
  put_tag(out, 0, "RIFF");
  put_u32_le(out, 4, total_size - 8);
  put_tag(out, 8, "WAVE");

  put_tag(out, 12, "fmt ");
  put_u32_le(out, 16, 16);
  put_u16_le(out, 20, kFormatPcm);
  put_u16_le(out, 22, channels);
  put_u32_le(out, 24, sample_rate);
  put_u32_le(out, 28, byte_rate);
  put_u16_le(out, 32, block_align);
  put_u16_le(out, 34, kBitsPerSample);

  put_tag(out, 36, "data");
  put_u32_le(out, 40, data_size);
  return out;
}
}  // namespace

WavEncoder::WavEncoder() = default;

int16_t WavEncoder::quantize(float sample)
{
  if (std::isnan(sample)) {
    return 0;
  }
  const double s = (sample < -1.0F) ? -1.0 : (sample > 1.0F ? 1.0 : static_cast<double>(sample));
  const double scaled = s < 0.0 ? s * 0x8000 : s * 0x7FFF;
  // 0 방향 절삭
  return static_cast<int16_t>(static_cast<int32_t>(scaled));
}

vector<uint8_t> WavEncoder::encode(const RawAudioBuffer & buffer) const
{
  const uint16_t channels = buffer.channels.empty() ?
    1 : static_cast<uint16_t>(buffer.channels.size());
  const size_t sample_count = buffer.sample_count();

  vector<uint8_t> out = make_container(channels, buffer.sample_rate, sample_count);
  if (buffer.channels.empty()) {
    return out;
  }

  const vector<float> & channel0 = buffer.channels.front();
  for (size_t i = 0; i < sample_count; ++i) {
    const int16_t pcm = quantize(channel0[i]);
    put_u16_le(out, kWavHeaderSize + i * kBytesPerSample, static_cast<uint16_t>(pcm));
  }
  return out;
}

WavValidator::WavValidator() = default;

bool WavValidator::validate(const vector<uint8_t> & bytes) const
{
  if (bytes.size() < kWavHeaderSize) {
    return false;
  }
  const uint8_t * p = bytes.data();
  if (!has_tag(p, "RIFF")) {
    return false;
  }
  if (!has_tag(p + 8, "WAVE")) {
    return false;
  }
  if (!has_tag(p + 12, "fmt ")) {
    return false;
  }
  return get_u16_le(p + 20) == kFormatPcm;
}

/// 파일 앞 44바이트만 읽어 검증. 읽기 실패는 모두 검증 실패로 처리 (fail closed)
bool WavValidator::validate_file(const string & file_path) const
{
  try {
    ifstream in(file_path, ios::binary);
    if (!in.is_open()) {
      return false;
    }
    in.exceptions(ifstream::badbit);

    vector<uint8_t> header(kWavHeaderSize, 0);
    in.read(reinterpret_cast<char *>(header.data()), static_cast<streamsize>(header.size()));
    if (static_cast<size_t>(in.gcount()) < kWavHeaderSize) {
      return false;
    }
    return validate(header);
  } catch (const ios_base::failure &) {
    return false;
  } catch (const bad_alloc &) {
    return false;
  }
}

bool WavValidator::parse_header(const vector<uint8_t> & bytes, WavHeaderInfo & out) const
{
  if (!validate(bytes)) {
    return false;
  }
  const uint8_t * p = bytes.data();
  if (!has_tag(p + 36, "data")) {
    return false;
  }

  WavHeaderInfo info;
  info.riff_size = get_u32_le(p + 4);
  info.format_code = get_u16_le(p + 20);
  info.channels = get_u16_le(p + 22);
  info.sample_rate = get_u32_le(p + 24);
  info.byte_rate = get_u32_le(p + 28);
  info.block_align = get_u16_le(p + 32);
  info.bits_per_sample = get_u16_le(p + 34);
  info.data_size = get_u32_le(p + 40);
  out = info;
  return true;
}

bool decode_pcm_f32le(
  const vector<uint8_t> & bytes,
  uint32_t sample_rate,
  uint16_t channels,
  RawAudioBuffer & out)
{
  if (channels == 0 || sample_rate == 0) {
    return false;
  }
  const size_t frame_bytes = sizeof(float) * channels;
  if (bytes.size() % frame_bytes != 0) {
    return false;
  }

  const size_t frames = bytes.size() / frame_bytes;
  RawAudioBuffer buffer;
  buffer.sample_rate = sample_rate;
  buffer.channels.assign(channels, vector<float>(frames, 0.0F));

  for (size_t i = 0; i < frames; ++i) {
    for (uint16_t ch = 0; ch < channels; ++ch) {
      const uint32_t bits = get_u32_le(bytes.data() + (i * channels + ch) * sizeof(float));
      float value = 0.0F;
      memcpy(&value, &bits, sizeof(value));
      buffer.channels[ch][i] = value;
    }
  }
  out = move(buffer);
  return true;
}

}  // namespace voice_capture_cpp
