#include "voice_feature_cpp/transport_error.hpp"

using namespace std;


namespace voice_feature_cpp
{

string to_string(FeatureError error)
{
  switch (error) {
    case FeatureError::NONE:
      return "NONE";
    case FeatureError::MISSING_PAYLOAD:
      return "MISSING_PAYLOAD";
    case FeatureError::UNSUPPORTED_FORMAT:
      return "UNSUPPORTED_FORMAT";
    case FeatureError::VALIDATION_FAILURE:
      return "VALIDATION_FAILURE";
    case FeatureError::INVALID_REQUEST:
      return "INVALID_REQUEST";
    case FeatureError::PAYLOAD_TOO_LARGE:
      return "PAYLOAD_TOO_LARGE";
    case FeatureError::UNSUPPORTED_MEDIA_TYPE:
      return "UNSUPPORTED_MEDIA_TYPE";
    case FeatureError::UNPROCESSABLE_CONTENT:
      return "UNPROCESSABLE_CONTENT";
    case FeatureError::REMOTE_PROCESSING_ERROR:
      return "REMOTE_PROCESSING_ERROR";
    case FeatureError::NETWORK_ERROR:
      return "NETWORK_ERROR";
    case FeatureError::INVALID_RESPONSE:
      return "INVALID_RESPONSE";
    case FeatureError::CANCELLED:
      return "CANCELLED";
    default:
      return "UNKNOWN";
  }
}

FeatureError classify_http_status(long http_code)
{
  switch (http_code) {
    case 400:
      return FeatureError::INVALID_REQUEST;
    case 413:
      return FeatureError::PAYLOAD_TOO_LARGE;
    case 415:
      return FeatureError::UNSUPPORTED_MEDIA_TYPE;
    case 422:
      return FeatureError::UNPROCESSABLE_CONTENT;
    case 500:
      return FeatureError::REMOTE_PROCESSING_ERROR;
    default:
      return FeatureError::NETWORK_ERROR;
  }
}

bool is_client_precondition(FeatureError error)
{
  return error == FeatureError::MISSING_PAYLOAD ||
    error == FeatureError::UNSUPPORTED_FORMAT ||
    error == FeatureError::VALIDATION_FAILURE;
}

}  // namespace voice_feature_cpp
