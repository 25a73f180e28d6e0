#pragma once

#include <string>

namespace voice_feature_cpp
{

enum class FeatureError
{
  NONE,
  // 클라이언트 측 사전 조건 (재시도 없이 즉시 반환)
  MISSING_PAYLOAD,
  UNSUPPORTED_FORMAT,
  VALIDATION_FAILURE,
  // 원격/전송 오류
  INVALID_REQUEST,
  PAYLOAD_TOO_LARGE,
  UNSUPPORTED_MEDIA_TYPE,
  UNPROCESSABLE_CONTENT,
  REMOTE_PROCESSING_ERROR,
  NETWORK_ERROR,
  INVALID_RESPONSE,
  CANCELLED
};

std::string to_string(FeatureError error);

/// 400/413/415/422/500 외의 상태 코드는 NETWORK_ERROR
FeatureError classify_http_status(long http_code);

bool is_client_precondition(FeatureError error);

}  // namespace voice_feature_cpp
