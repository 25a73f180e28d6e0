#pragma once

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>

namespace voice_common
{

/// "field": 뒤 값의 시작 위치를 반환 (없으면 npos)
/// 같은 문자열이 값으로 등장하는 경우를 피하기 위해 키 뒤에 ':'가 오는 위치만 인정
inline size_t find_json_value_start(const std::string & json, const std::string & field)
{
  const std::string key = "\"" + field + "\"";
  size_t key_pos = json.find(key);
  while (key_pos != std::string::npos) {
    size_t pos = key_pos + key.size();
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos])) != 0) {
      ++pos;
    }
    if (pos < json.size() && json[pos] == ':') {
      ++pos;
      while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos])) != 0) {
        ++pos;
      }
      return pos < json.size() ? pos : std::string::npos;
    }
    key_pos = json.find(key, key_pos + 1);
  }
  return std::string::npos;
}

/// JSON 응답에서 특정 문자열 필드 값을 추출 (경량 파서, 외부 라이브러리 불필요)
/// "field":"value" 패턴을 찾아 이스케이프를 해제한 value를 out에 저장
inline bool extract_json_string_field(
  const std::string & json, const std::string & field, std::string & out)
{
  size_t start = find_json_value_start(json, field);
  if (start == std::string::npos || json[start] != '"') {
    return false;
  }
  ++start;

  std::string value;
  bool escaping = false;
  for (size_t i = start; i < json.size(); ++i) {
    const char c = json[i];
    if (escaping) {
      switch (c) {
        case '"':
        case '\\':
        case '/':
          value.push_back(c);
          break;
        case 'b':
          value.push_back('\b');
          break;
        case 'f':
          value.push_back('\f');
          break;
        case 'n':
          value.push_back('\n');
          break;
        case 'r':
          value.push_back('\r');
          break;
        case 't':
          value.push_back('\t');
          break;
        default:
          value.push_back(c);
          break;
      }
      escaping = false;
      continue;
    }
    if (c == '\\') {
      escaping = true;
      continue;
    }
    if (c == '"') {
      out = value;
      return true;
    }
    value.push_back(c);
  }
  return false;
}

/// "field": 123.4 형태의 숫자 필드 추출. 문자열/객체/null/비유한 값이면 false
inline bool extract_json_number_field(
  const std::string & json, const std::string & field, double & out)
{
  const size_t start = find_json_value_start(json, field);
  if (start == std::string::npos) {
    return false;
  }
  const char first = json[start];
  if (first == '"' || first == '{' || first == '[' || first == 'n' ||
    first == 't' || first == 'f')
  {
    return false;
  }

  const char * begin = json.c_str() + start;
  char * end = nullptr;
  errno = 0;
  const double value = std::strtod(begin, &end);
  // strtod는 NaN/Infinity도 받아들이므로 유한값만 인정
  if (end == begin || errno == ERANGE || !std::isfinite(value)) {
    return false;
  }
  out = value;
  return true;
}

/// 필드 값을 가공하지 않은 JSON 텍스트 그대로 추출 (객체/배열은 괄호 짝을 맞춰 통째로)
inline bool extract_json_raw_field(
  const std::string & json, const std::string & field, std::string & out)
{
  const size_t start = find_json_value_start(json, field);
  if (start == std::string::npos) {
    return false;
  }

  int depth = 0;
  bool in_string = false;
  bool escaping = false;
  for (size_t i = start; i < json.size(); ++i) {
    const char c = json[i];
    if (in_string) {
      if (escaping) {
        escaping = false;
      } else if (c == '\\') {
        escaping = true;
      } else if (c == '"') {
        in_string = false;
        if (depth == 0) {
          out = json.substr(start, i + 1 - start);
          return true;
        }
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '{' || c == '[') {
      ++depth;
    } else if (c == '}' || c == ']') {
      if (depth == 0) {
        out = json.substr(start, i - start);
        return !out.empty();
      }
      --depth;
      if (depth == 0) {
        out = json.substr(start, i + 1 - start);
        return true;
      }
    } else if (c == ',' && depth == 0) {
      out = json.substr(start, i - start);
      return !out.empty();
    }
  }
  return false;
}

/// 응답 본문이 JSON 객체('{'로 시작)인지 대략 확인
inline bool looks_like_json_object(const std::string & json)
{
  for (const char c : json) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      continue;
    }
    return c == '{';
  }
  return false;
}

}  // namespace voice_common
