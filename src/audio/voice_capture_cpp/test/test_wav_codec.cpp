#include <gtest/gtest.h>

#include "voice_capture_cpp/wav_codec.hpp"
#include "voice_capture_cpp/wav_writer.hpp"

#include <cmath>
#include <cstring>
#include <filesystem>
#include <vector>

using namespace std;

namespace voice_capture_cpp
{
namespace
{

RawAudioBuffer make_mono(size_t samples, uint32_t rate = 16000)
{
  RawAudioBuffer buffer;
  buffer.sample_rate = rate;
  buffer.channels.emplace_back(samples, 0.25F);
  return buffer;
}

uint16_t read_u16(const vector<uint8_t> & b, size_t off)
{
  return static_cast<uint16_t>(b[off] | (b[off + 1] << 8));
}

TEST(WavEncoder, OutputSizeAndValidity)
{
  WavEncoder encoder;
  WavValidator validator;
  for (size_t n : {size_t{1}, size_t{160}, size_t{16000}}) {
    const auto bytes = encoder.encode(make_mono(n));
    EXPECT_EQ(bytes.size(), kWavHeaderSize + n * 2);
    EXPECT_TRUE(validator.validate(bytes));
  }
}

TEST(WavEncoder, HeaderDataSizeMatchesSampleCount)
{
  WavEncoder encoder;
  WavValidator validator;
  const auto bytes = encoder.encode(make_mono(1234, 8000));

  WavHeaderInfo info;
  ASSERT_TRUE(validator.parse_header(bytes, info));
  EXPECT_EQ(info.sample_count(), 1234u);
  EXPECT_EQ(info.format_code, 1);
  EXPECT_EQ(info.channels, 1);
  EXPECT_EQ(info.sample_rate, 8000u);
  EXPECT_EQ(info.byte_rate, 16000u);
  EXPECT_EQ(info.bits_per_sample, 16);
  EXPECT_EQ(info.riff_size, bytes.size() - 8);
}

TEST(WavEncoder, EmptyBufferProducesHeaderOnly)
{
  WavEncoder encoder;
  WavValidator validator;
  RawAudioBuffer empty;
  const auto bytes = encoder.encode(empty);
  ASSERT_EQ(bytes.size(), kWavHeaderSize);
  EXPECT_TRUE(validator.validate(bytes));
  EXPECT_EQ(read_u16(bytes, 22), 1);
}

TEST(WavEncoder, QuantizationIsAsymmetric)
{
  EXPECT_EQ(WavEncoder::quantize(0.0F), 0);
  EXPECT_EQ(WavEncoder::quantize(-1.0F), -32768);
  EXPECT_EQ(WavEncoder::quantize(1.0F), 32767);
  EXPECT_EQ(WavEncoder::quantize(0.5F), 16383);
  EXPECT_EQ(WavEncoder::quantize(-0.5F), -16384);
}

TEST(WavEncoder, QuantizationClampsOutOfRange)
{
  EXPECT_EQ(WavEncoder::quantize(3.0F), 32767);
  EXPECT_EQ(WavEncoder::quantize(-7.5F), -32768);
  EXPECT_EQ(WavEncoder::quantize(NAN), 0);
}

TEST(WavEncoder, SamplesAreLittleEndian)
{
  WavEncoder encoder;
  RawAudioBuffer buffer;
  buffer.channels.push_back({-1.0F, 1.0F});
  const auto bytes = encoder.encode(buffer);
  EXPECT_EQ(bytes[44], 0x00);
  EXPECT_EQ(bytes[45], 0x80);
  EXPECT_EQ(bytes[46], 0xFF);
  EXPECT_EQ(bytes[47], 0x7F);
}

TEST(WavEncoder, MultichannelHeaderKeepsChannelCount)
{
  WavEncoder encoder;
  WavValidator validator;
  RawAudioBuffer buffer;
  buffer.channels.emplace_back(100, 0.1F);
  buffer.channels.emplace_back(100, -0.1F);
  const auto bytes = encoder.encode(buffer);

  WavHeaderInfo info;
  ASSERT_TRUE(validator.parse_header(bytes, info));
  EXPECT_EQ(info.channels, 2);
  EXPECT_EQ(info.block_align, 4);
  EXPECT_EQ(info.sample_count(), 100u);
  EXPECT_EQ(bytes.size(), kWavHeaderSize + 100 * 4);
}

TEST(WavValidator, RejectsMalformedContainers)
{
  WavEncoder encoder;
  WavValidator validator;

  EXPECT_FALSE(validator.validate({}));
  EXPECT_FALSE(validator.validate(vector<uint8_t>(43, 0)));

  auto bad_fmt = encoder.encode(make_mono(10));
  memcpy(bad_fmt.data() + 12, "fmx ", 4);
  EXPECT_FALSE(validator.validate(bad_fmt));

  auto float_format = encoder.encode(make_mono(10));
  float_format[20] = 3;
  float_format[21] = 0;
  EXPECT_FALSE(validator.validate(float_format));

  auto bad_riff = encoder.encode(make_mono(10));
  memcpy(bad_riff.data(), "RIFX", 4);
  EXPECT_FALSE(validator.validate(bad_riff));
}

TEST(WavValidator, ValidateFile)
{
  const auto dir = filesystem::temp_directory_path() / "voice_capture_cpp_test";
  WavWriter writer;
  ASSERT_TRUE(writer.ensure_output_dir(dir.string()));

  WavEncoder encoder;
  WavValidator validator;
  const string good = (dir / "good.wav").string();
  ASSERT_TRUE(writer.write_bytes(good, encoder.encode(make_mono(32))));
  EXPECT_TRUE(validator.validate_file(good));

  const string truncated = (dir / "short.wav").string();
  ASSERT_TRUE(writer.write_bytes(truncated, vector<uint8_t>(20, 0)));
  EXPECT_FALSE(validator.validate_file(truncated));

  EXPECT_FALSE(validator.validate_file((dir / "missing.wav").string()));
  filesystem::remove_all(dir);
}

TEST(WavWriter, OutputPathPrefixesTimestamp)
{
  WavWriter writer;
  const string path = writer.make_output_path("/tmp/out", "voice-recording.wav");
  ASSERT_EQ(path.rfind("/tmp/out/", 0), 0u);
  // "/tmp/out/" + "YYYYmmdd_HHMMSS_" + filename
  EXPECT_EQ(path.size(), string("/tmp/out/").size() + 16 + string("voice-recording.wav").size());
  EXPECT_NE(path.find("_voice-recording.wav"), string::npos);
}

TEST(DecodePcmF32, RestoresInterleavedChannels)
{
  const vector<float> interleaved = {0.5F, -0.5F, 0.25F, -0.25F};
  vector<uint8_t> bytes(interleaved.size() * sizeof(float));
  memcpy(bytes.data(), interleaved.data(), bytes.size());

  RawAudioBuffer buffer;
  ASSERT_TRUE(decode_pcm_f32le(bytes, 16000, 2, buffer));
  ASSERT_EQ(buffer.channel_count(), 2u);
  ASSERT_EQ(buffer.sample_count(), 2u);
  EXPECT_FLOAT_EQ(buffer.channels[0][1], 0.25F);
  EXPECT_FLOAT_EQ(buffer.channels[1][0], -0.5F);

  EXPECT_FALSE(decode_pcm_f32le(vector<uint8_t>(6, 0), 16000, 1, buffer));
  EXPECT_FALSE(decode_pcm_f32le(bytes, 16000, 0, buffer));
}

}  // namespace
}  // namespace voice_capture_cpp
