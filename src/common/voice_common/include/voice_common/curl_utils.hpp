#pragma once

#include <curl/curl.h>

#include <atomic>
#include <cstddef>
#include <string>

namespace voice_common
{

/// cURL 수신 데이터를 std::string 버퍼에 누적하는 콜백
inline size_t curl_write_callback(void * contents, size_t size, size_t nmemb, void * userp)
{
  const size_t total = size * nmemb;
  auto * buffer = static_cast<std::string *>(userp);
  buffer->append(static_cast<const char *>(contents), total);
  return total;
}

/// 네트워크 장애(DNS, 연결, 타임아웃 등)에 해당하는 cURL 에러 코드인지 판별
inline bool is_network_error_code(int curl_code)
{
  return curl_code == CURLE_COULDNT_RESOLVE_HOST ||
    curl_code == CURLE_COULDNT_CONNECT ||
    curl_code == CURLE_OPERATION_TIMEDOUT ||
    curl_code == CURLE_GOT_NOTHING ||
    curl_code == CURLE_SEND_ERROR ||
    curl_code == CURLE_RECV_ERROR ||
    curl_code == CURLE_SSL_CONNECT_ERROR;
}

/// CURLOPT_XFERINFOFUNCTION 용 콜백: clientp의 취소 플래그가 켜지면 0이 아닌 값을 반환해 전송 중단
/// (curl_easy_perform은 CURLE_ABORTED_BY_CALLBACK 반환)
inline int curl_abort_on_flag(
  void * clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
  curl_off_t /*ultotal*/, curl_off_t /*ulnow*/)
{
  const auto * flag = static_cast<const std::atomic<bool> *>(clientp);
  return (flag && flag->load()) ? 1 : 0;
}

/// RAII 방식으로 curl_global_init/cleanup을 관리 (프로세스당 1개 static 인스턴스)
class CurlGlobalGuard
{
public:
  CurlGlobalGuard()
  {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }

  ~CurlGlobalGuard()
  {
    curl_global_cleanup();
  }

  CurlGlobalGuard(const CurlGlobalGuard &) = delete;
  CurlGlobalGuard & operator=(const CurlGlobalGuard &) = delete;
};

}  // namespace voice_common
