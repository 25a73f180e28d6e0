#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "voice_feature_cpp/cancel_token.hpp"

namespace voice_feature_cpp
{

struct MultipartUpload
{
  std::string url;
  std::vector<std::string> header_lines;
  std::string field_name;
  std::string filename;
  std::string content_type;
  const std::vector<uint8_t> * data = nullptr;
  long timeout_sec = 30;
};

struct HttpResponse
{
  // 응답 수신 여부 (false면 http_code 무의미)
  bool received = false;
  bool timed_out = false;
  bool cancelled = false;
  long http_code = 0;
  std::string body;
  std::string error;
};

/// HTTP 요청 1회 수행. 재시도/분류는 호출자 책임
class HttpTransport
{
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse post_multipart(
    const MultipartUpload & upload, const CancelToken * cancel) = 0;
  virtual HttpResponse get(
    const std::string & url,
    const std::vector<std::string> & header_lines,
    long timeout_sec,
    const CancelToken * cancel) = 0;
};

/// libcurl easy/mime 기반 구현
class CurlHttpTransport : public HttpTransport
{
public:
  CurlHttpTransport();

  HttpResponse post_multipart(
    const MultipartUpload & upload, const CancelToken * cancel) override;
  HttpResponse get(
    const std::string & url,
    const std::vector<std::string> & header_lines,
    long timeout_sec,
    const CancelToken * cancel) override;
};

}  // namespace voice_feature_cpp
