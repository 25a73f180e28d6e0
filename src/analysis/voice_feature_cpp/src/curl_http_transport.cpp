#include "voice_feature_cpp/http_transport.hpp"

#include <voice_common/curl_utils.hpp>

#include <curl/curl.h>

using namespace std;


namespace voice_feature_cpp
{
namespace
{

static const voice_common::CurlGlobalGuard curl_guard;

struct curl_slist * make_header_list(const vector<string> & header_lines)
{
  struct curl_slist * headers = nullptr;
  for (const auto & h : header_lines) {
    headers = curl_slist_append(headers, h.c_str());
  }
  return headers;
}

/// 공통 옵션: 응답 버퍼, 타임아웃, 취소 플래그 연결
void apply_common_options(
  CURL * curl, string & response_body, long timeout_sec, const CancelToken * cancel)
{
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, voice_common::curl_write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  if (cancel) {
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, voice_common::curl_abort_on_flag);
    curl_easy_setopt(
      curl, CURLOPT_XFERINFODATA,
      const_cast<atomic<bool> *>(&cancel->flag()));
  }
}

void fill_response(CURL * curl, CURLcode rc, HttpResponse & out)
{
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

  if (rc == CURLE_OK) {
    out.received = true;
    out.http_code = http_code;
    return;
  }

  out.cancelled = rc == CURLE_ABORTED_BY_CALLBACK;
  out.timed_out = rc == CURLE_OPERATION_TIMEDOUT;
  if (voice_common::is_network_error_code(rc)) {
    out.error = string("network_error:") + curl_easy_strerror(rc);
  } else {
    out.error = string("curl_error:") + curl_easy_strerror(rc);
  }
}

}  // namespace

CurlHttpTransport::CurlHttpTransport() = default;

HttpResponse CurlHttpTransport::post_multipart(
  const MultipartUpload & upload, const CancelToken * cancel)
{
  HttpResponse out;
  if (!upload.data) {
    out.error = "empty_upload_data";
    return out;
  }

  CURL * curl = curl_easy_init();
  if (!curl) {
    out.error = "curl_init_failed";
    return out;
  }

  struct curl_slist * headers = make_header_list(upload.header_lines);

  curl_mime * mime = curl_mime_init(curl);
  curl_mimepart * part = curl_mime_addpart(mime);
  curl_mime_name(part, upload.field_name.c_str());
  curl_mime_data(
    part, reinterpret_cast<const char *>(upload.data->data()), upload.data->size());
  curl_mime_filename(part, upload.filename.c_str());
  curl_mime_type(part, upload.content_type.c_str());

  curl_easy_setopt(curl, CURLOPT_URL, upload.url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
  apply_common_options(curl, out.body, upload.timeout_sec, cancel);

  const CURLcode rc = curl_easy_perform(curl);
  fill_response(curl, rc, out);

  curl_mime_free(mime);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return out;
}

HttpResponse CurlHttpTransport::get(
  const string & url,
  const vector<string> & header_lines,
  long timeout_sec,
  const CancelToken * cancel)
{
  HttpResponse out;
  CURL * curl = curl_easy_init();
  if (!curl) {
    out.error = "curl_init_failed";
    return out;
  }

  struct curl_slist * headers = make_header_list(header_lines);
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  apply_common_options(curl, out.body, timeout_sec, cancel);

  const CURLcode rc = curl_easy_perform(curl);
  fill_response(curl, rc, out);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return out;
}

}  // namespace voice_feature_cpp
