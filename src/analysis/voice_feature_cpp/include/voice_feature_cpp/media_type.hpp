#pragma once

#include <string>

namespace voice_feature_cpp
{

struct MediaDescriptor
{
  std::string mime_type;  // "audio/wav" | "audio/webm"
  std::string extension;  // "wav" | "webm"
  std::string filename;   // "voice-recording.<extension>"

  bool is_wav() const { return extension == "wav"; }
};

/// 업로드 전 미디어 타입 정규화
/// 소문자화, 파라미터 제거("audio/webm;codecs=opus" → "audio/webm"), "audio/" 접두사 생략 허용
/// 빈 문자열은 WAV. 허용 목록(webm, wav, wave, x-wav) 밖이면 false
bool normalize_media_type(const std::string & media_type, MediaDescriptor & out);

}  // namespace voice_feature_cpp
