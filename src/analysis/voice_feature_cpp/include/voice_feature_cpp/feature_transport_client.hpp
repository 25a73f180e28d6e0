#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "voice_capture_cpp/audio_payload.hpp"
#include "voice_capture_cpp/wav_codec.hpp"

#include "voice_feature_cpp/cancel_token.hpp"
#include "voice_feature_cpp/http_transport.hpp"
#include "voice_feature_cpp/media_type.hpp"
#include "voice_feature_cpp/transport_error.hpp"
#include "voice_feature_cpp/voice_features.hpp"

namespace voice_feature_cpp
{

struct TransportConfig
{
  // "http://host:8000" 또는 "http://host:8000/api/v1"
  std::string base_url = "http://localhost:8000";
  std::string api_key;
  long timeout_sec = 30;
  int max_attempts = 3;
  std::chrono::milliseconds retry_delay{1000};
  // false: 4xx 응답은 재시도하지 않음. true: 모든 실패를 동일하게 재시도
  bool retry_client_errors = false;
};

/// 업로드 시도 1회의 기록 (결과와 함께 호출자에게 전달, 저장하지 않음)
struct TransportAttempt
{
  int attempt = 0;
  std::string method = "POST";
  size_t payload_bytes = 0;
  std::string media_type;
  bool ok = false;
  FeatureError error = FeatureError::NONE;
  long http_code = 0;
  std::string message;
};

struct TransportResult
{
  bool ok = false;
  FeatureError error = FeatureError::NONE;
  std::string message;
  CanonicalVoiceFeatures features;
  std::vector<TransportAttempt> attempts;
};

class FeatureTransportClient
{
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  explicit FeatureTransportClient(
    const TransportConfig & config,
    std::shared_ptr<HttpTransport> transport = nullptr,
    Sleeper sleeper = nullptr);

  /// payload 1개를 원격 분석기로 업로드하고 표준 특징 벡터로 정규화
  /// 사전 조건 오류는 네트워크 요청 없이 즉시 반환, 전송 오류는 재시도 정책에 따름
  TransportResult analyze(
    const voice_capture_cpp::AudioPayload & payload,
    const CancelToken * cancel = nullptr) const;
  TransportResult analyze_file(
    const std::string & file_path,
    const std::string & media_type,
    const CancelToken * cancel = nullptr) const;

  bool check_health(std::string & error) const;

  std::string analyze_url() const;
  std::string health_url() const;
  const TransportConfig & config() const;

private:
  TransportAttempt attempt_once(
    const MultipartUpload & upload,
    int attempt,
    const CancelToken * cancel,
    CanonicalVoiceFeatures & features) const;
  bool should_retry(const TransportAttempt & attempt) const;
  bool pause_before_retry(const CancelToken * cancel) const;
  std::string api_root() const;
  std::vector<std::string> header_lines() const;

  TransportConfig config_;
  std::shared_ptr<HttpTransport> transport_;
  Sleeper sleeper_;
  voice_capture_cpp::WavValidator validator_;
};

/// 오류 응답 본문에서 사용자 메시지 추출
/// detail이 문자열이면 그대로, 객체면 message 필드(없으면 객체 텍스트), 그 외엔 본문 전체
std::string extract_error_detail(const std::string & body);

}  // namespace voice_feature_cpp
