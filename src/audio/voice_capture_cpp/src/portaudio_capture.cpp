#include "voice_capture_cpp/portaudio_capture.hpp"

#include <cstdint>
#include <cstring>
#include <utility>

using namespace std;


namespace voice_capture_cpp
{

PortAudioCapture::PortAudioCapture()
: device_index_(-1),
  sample_rate_(16000),
  channels_(1),
  frames_per_chunk_(1024),
  selected_device_index_(paNoDevice),
  running_(false),
  initialized_(false),
  stream_(nullptr)
{
}

PortAudioCapture::~PortAudioCapture()
{
  close();
}

bool PortAudioCapture::configure(int device_index, int sample_rate, int channels, int frames_per_chunk)
{
  if (is_open()) return false;  // 실행 중 설정 변경 금지
  if (sample_rate <= 0 || channels <= 0 || frames_per_chunk <= 0) return false;

  device_index_ = device_index;
  sample_rate_ = sample_rate;
  channels_ = channels;
  frames_per_chunk_ = frames_per_chunk;
  return true;
}

/// 지정 인덱스가 입력 채널을 가지면 사용, 아니면 시스템 기본 입력 장치
int PortAudioCapture::resolve_device_index_() const
{
  const int device_count = Pa_GetDeviceCount();
  if (device_count <= 0) return paNoDevice;

  if (device_index_ >= 0 && device_index_ < device_count) {
    const PaDeviceInfo * info = Pa_GetDeviceInfo(device_index_);
    if (info && info->maxInputChannels >= channels_) {
      return device_index_;
    }
  }
  return Pa_GetDefaultInputDevice();
}

/// PortAudio 초기화 → 장치 선택 → float32 스트림 오픈 → 콜백 시작
/// 어느 단계에서 실패해도 잡은 자원은 모두 되돌린 뒤 false 반환
bool PortAudioCapture::open(ChunkCallback callback)
{
  if (running_) return true;

  last_error_.clear();
  selected_device_index_ = paNoDevice;
  selected_device_name_.clear();
  {
    lock_guard<mutex> lock(cb_mutex_);
    callback_ = move(callback);
  }

  PaError err = Pa_Initialize();
  if (err != paNoError) {
    last_error_ = Pa_GetErrorText(err);
    return false;
  }
  initialized_ = true;

  const int dev = resolve_device_index_();
  const PaDeviceInfo * dev_info = (dev == paNoDevice) ? nullptr : Pa_GetDeviceInfo(dev);
  if (!dev_info || dev_info->maxInputChannels < channels_) {
    last_error_ = "no_input_device";
    close();
    return false;
  }
  selected_device_index_ = dev;
  selected_device_name_ = dev_info->name ? dev_info->name : "";

  PaStreamParameters in_params;
  in_params.device = dev;
  in_params.channelCount = channels_;
  in_params.sampleFormat = paFloat32;
  in_params.suggestedLatency = dev_info->defaultLowInputLatency;
  in_params.hostApiSpecificStreamInfo = nullptr;

  err = Pa_OpenStream(
    &stream_,
    &in_params,
    nullptr,
    sample_rate_,
    static_cast<unsigned long>(frames_per_chunk_),
    paNoFlag,
    &PortAudioCapture::pa_callback,
    this);
  if (err != paNoError) {
    stream_ = nullptr;
    last_error_ = Pa_GetErrorText(err);
    close();
    return false;
  }

  running_ = true;
  err = Pa_StartStream(stream_);
  if (err != paNoError) {
    last_error_ = Pa_GetErrorText(err);
    close();
    return false;
  }
  return true;
}

/// 스트림 정지/해제 후 Pa_Terminate까지 수행해 장치 핸들을 반납
void PortAudioCapture::close()
{
  running_ = false;

  if (stream_) {
    if (Pa_IsStreamActive(stream_) == 1) {
      Pa_StopStream(stream_);
    }
    Pa_CloseStream(stream_);
    stream_ = nullptr;
  }

  if (initialized_) {
    Pa_Terminate();
    initialized_ = false;
  }

  lock_guard<mutex> lock(cb_mutex_);
  callback_ = nullptr;
}

bool PortAudioCapture::is_open() const
{
  return running_.load();
}

string PortAudioCapture::media_type() const
{
  return kMediaTypePcmF32;
}

string PortAudioCapture::last_error() const
{
  return last_error_;
}

int PortAudioCapture::sample_rate() const
{
  return sample_rate_;
}

int PortAudioCapture::channels() const
{
  return channels_;
}

int PortAudioCapture::selected_device_index() const
{
  return selected_device_index_;
}

string PortAudioCapture::selected_device_name() const
{
  return selected_device_name_;
}

/// PortAudio 콜백 (오디오 스레드): float 샘플을 LE 바이트 chunk로 직렬화 후 콜백 호출
int PortAudioCapture::pa_callback(const void * input,
                                  void * /*output*/,
                                  unsigned long frameCount,
                                  const PaStreamCallbackTimeInfo * /*timeInfo*/,
                                  PaStreamCallbackFlags /*statusFlags*/,
                                  void * userData)
{
  auto * self = static_cast<PortAudioCapture *>(userData);
  if (!self || !self->running_.load()) return paComplete;

  const auto * in = static_cast<const float *>(input);
  if (!in) return paContinue;

  const size_t count = static_cast<size_t>(frameCount) * static_cast<size_t>(self->channels_);
  AudioChunk chunk(count * sizeof(float));
  for (size_t i = 0; i < count; ++i) {
    uint32_t bits = 0;
    memcpy(&bits, &in[i], sizeof(bits));
    chunk[i * 4] = static_cast<uint8_t>(bits & 0xFF);
    chunk[i * 4 + 1] = static_cast<uint8_t>((bits >> 8) & 0xFF);
    chunk[i * 4 + 2] = static_cast<uint8_t>((bits >> 16) & 0xFF);
    chunk[i * 4 + 3] = static_cast<uint8_t>((bits >> 24) & 0xFF);
  }

  CaptureDevice::ChunkCallback cb;
  {
    lock_guard<mutex> lock(self->cb_mutex_);
    cb = self->callback_;
  }
  if (cb) {
    cb(chunk);
  }
  return paContinue;
}

}  // namespace voice_capture_cpp
