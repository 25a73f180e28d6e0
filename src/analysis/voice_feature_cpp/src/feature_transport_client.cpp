#include "voice_feature_cpp/feature_transport_client.hpp"

#include <voice_common/json_utils.hpp>
#include <voice_common/string_utils.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>
#include <utility>

using namespace std;


namespace voice_feature_cpp
{
namespace
{

constexpr const char * kAudioFieldName = "audio_file";
constexpr chrono::milliseconds kCancelPollInterval{50};

TransportResult fail_fast(FeatureError error, const string & message)
{
  TransportResult result;
  result.error = error;
  result.message = message;
  return result;
}

/// 미디어 타입이 비어 있으면 확장자로 추정
/// 확장자 없음/.wav/.wave는 WAV, 그 외는 audio/<확장자>로 넘겨 정규화 단계에서 판정
string infer_media_type(const string & file_path)
{
  const string ext = voice_common::to_lower(filesystem::path(file_path).extension().string());
  if (ext.empty() || ext == ".wav" || ext == ".wave") {
    return "";
  }
  return "audio/" + ext.substr(1);
}

}  // namespace

string extract_error_detail(const string & body)
{
  string raw;
  if (!voice_common::extract_json_raw_field(body, "detail", raw)) {
    return voice_common::trim(body);
  }
  raw = voice_common::trim(raw);
  if (raw.empty() || raw == "null") {
    return voice_common::trim(body);
  }
  if (raw.front() == '"') {
    string text;
    if (voice_common::extract_json_string_field(body, "detail", text)) {
      return text;
    }
    return raw;
  }
  if (raw.front() == '{') {
    string message;
    if (voice_common::extract_json_string_field(raw, "message", message)) {
      return message;
    }
  }
  return raw;
}

FeatureTransportClient::FeatureTransportClient(
  const TransportConfig & config,
  shared_ptr<HttpTransport> transport,
  Sleeper sleeper)
: config_(config), transport_(move(transport)), sleeper_(move(sleeper))
{
  if (!transport_) {
    transport_ = make_shared<CurlHttpTransport>();
  }
}

const TransportConfig & FeatureTransportClient::config() const
{
  return config_;
}

/// base_url이 이미 /api/v1로 끝나면 중복해서 붙이지 않음
string FeatureTransportClient::api_root() const
{
  const string base = voice_common::strip_trailing_slashes(config_.base_url);
  if (voice_common::ends_with(base, "/api/v1")) {
    return base;
  }
  return base + "/api/v1";
}

string FeatureTransportClient::analyze_url() const
{
  return api_root() + "/analyze_voice";
}

string FeatureTransportClient::health_url() const
{
  return api_root() + "/";
}

vector<string> FeatureTransportClient::header_lines() const
{
  vector<string> headers;
  if (!config_.api_key.empty()) {
    headers.push_back("X-API-KEY: " + config_.api_key);
  }
  return headers;
}

TransportResult FeatureTransportClient::analyze(
  const voice_capture_cpp::AudioPayload & payload, const CancelToken * cancel) const
{
  if (payload.empty()) {
    return fail_fast(FeatureError::MISSING_PAYLOAD, "empty audio payload");
  }

  MediaDescriptor media;
  if (!normalize_media_type(payload.media_type, media)) {
    return fail_fast(
      FeatureError::UNSUPPORTED_FORMAT, "unsupported media type: " + payload.media_type);
  }
  if (media.is_wav() && !validator_.validate(payload.data)) {
    return fail_fast(FeatureError::VALIDATION_FAILURE, "payload is not a PCM WAV container");
  }

  MultipartUpload upload;
  upload.url = analyze_url();
  upload.header_lines = header_lines();
  upload.field_name = kAudioFieldName;
  upload.filename = media.filename;
  upload.content_type = media.mime_type;
  upload.data = &payload.data;
  upload.timeout_sec = config_.timeout_sec;

  TransportResult result;
  const int max_attempts = max(1, config_.max_attempts);
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (cancel && cancel->is_cancelled()) {
      result.error = FeatureError::CANCELLED;
      result.message = "upload cancelled";
      return result;
    }

    const TransportAttempt record = attempt_once(upload, attempt, cancel, result.features);
    result.attempts.push_back(record);
    if (record.ok) {
      result.ok = true;
      result.error = FeatureError::NONE;
      result.message.clear();
      return result;
    }

    result.error = record.error;
    result.message = record.message;
    if (attempt == max_attempts || !should_retry(record)) {
      break;
    }
    if (!pause_before_retry(cancel)) {
      result.error = FeatureError::CANCELLED;
      result.message = "upload cancelled";
      break;
    }
  }
  return result;
}

TransportResult FeatureTransportClient::analyze_file(
  const string & file_path, const string & media_type, const CancelToken * cancel) const
{
  voice_capture_cpp::AudioPayload payload;
  payload.media_type = media_type.empty() ? infer_media_type(file_path) : media_type;

  ifstream in(file_path, ios::binary);
  if (!in.is_open()) {
    return fail_fast(FeatureError::MISSING_PAYLOAD, "cannot open audio file: " + file_path);
  }
  payload.data.assign(istreambuf_iterator<char>(in), istreambuf_iterator<char>());
  if (in.bad()) {
    return fail_fast(FeatureError::MISSING_PAYLOAD, "cannot read audio file: " + file_path);
  }
  return analyze(payload, cancel);
}

/// 1회 전송 후 HTTP 상태/응답 본문을 오류 분류 또는 표준 특징으로 변환
TransportAttempt FeatureTransportClient::attempt_once(
  const MultipartUpload & upload,
  int attempt,
  const CancelToken * cancel,
  CanonicalVoiceFeatures & features) const
{
  TransportAttempt record;
  record.attempt = attempt;
  record.payload_bytes = upload.data ? upload.data->size() : 0;
  record.media_type = upload.content_type;

  const HttpResponse response = transport_->post_multipart(upload, cancel);
  if (!response.received) {
    if (response.cancelled) {
      record.error = FeatureError::CANCELLED;
      record.message = "upload cancelled";
    } else {
      record.error = FeatureError::NETWORK_ERROR;
      record.message = response.timed_out ? "timeout:" + response.error : response.error;
    }
    return record;
  }

  record.http_code = response.http_code;
  if (response.http_code >= 200 && response.http_code < 300) {
    string parse_error;
    if (!CanonicalVoiceFeatures::from_remote_json(response.body, features, parse_error)) {
      record.error = FeatureError::INVALID_RESPONSE;
      record.message = "invalid_response:" + parse_error;
      return record;
    }
    record.ok = true;
    return record;
  }

  record.error = classify_http_status(response.http_code);
  ostringstream msg;
  msg << "http_" << response.http_code;
  const string detail = extract_error_detail(response.body);
  if (!detail.empty()) {
    msg << ": " << detail;
  }
  record.message = msg.str();
  return record;
}

/// 네트워크 오류/타임아웃/5xx는 재시도, 4xx는 retry_client_errors일 때만 재시도
bool FeatureTransportClient::should_retry(const TransportAttempt & attempt) const
{
  if (attempt.error == FeatureError::CANCELLED ||
    attempt.error == FeatureError::INVALID_RESPONSE)
  {
    return false;
  }
  if (attempt.http_code >= 400 && attempt.http_code < 500) {
    return config_.retry_client_errors;
  }
  return true;
}

/// 고정 간격 대기. 대기 중 취소되면 false
bool FeatureTransportClient::pause_before_retry(const CancelToken * cancel) const
{
  if (sleeper_) {
    sleeper_(config_.retry_delay);
    return !(cancel && cancel->is_cancelled());
  }

  const auto deadline = chrono::steady_clock::now() + config_.retry_delay;
  while (chrono::steady_clock::now() < deadline) {
    if (cancel && cancel->is_cancelled()) {
      return false;
    }
    const auto remaining = chrono::duration_cast<chrono::milliseconds>(
      deadline - chrono::steady_clock::now());
    this_thread::sleep_for(min(remaining, kCancelPollInterval));
  }
  return !(cancel && cancel->is_cancelled());
}

bool FeatureTransportClient::check_health(string & error) const
{
  const HttpResponse response = transport_->get(
    health_url(), header_lines(), config_.timeout_sec, nullptr);
  if (!response.received) {
    error = response.error;
    return false;
  }
  if (response.http_code != 200) {
    ostringstream msg;
    msg << "http_" << response.http_code;
    error = msg.str();
    return false;
  }
  error.clear();
  return true;
}

}  // namespace voice_feature_cpp
