#include "voice_feature_cpp/media_type.hpp"

#include <voice_common/string_utils.hpp>

using namespace std;


namespace voice_feature_cpp
{

bool normalize_media_type(const string & media_type, MediaDescriptor & out)
{
  string base = voice_common::to_lower(media_type);
  const size_t param_pos = base.find(';');
  if (param_pos != string::npos) {
    base = base.substr(0, param_pos);
  }
  base = voice_common::trim(base);

  string subtype = base;
  if (base.compare(0, 6, "audio/") == 0) {
    subtype = base.substr(6);
  } else if (base.find('/') != string::npos) {
    // video/webm 등 audio 이외의 최상위 타입
    return false;
  }

  MediaDescriptor desc;
  if (base.empty() || subtype == "wav" || subtype == "wave" || subtype == "x-wav") {
    desc.mime_type = "audio/wav";
    desc.extension = "wav";
  } else if (subtype == "webm") {
    desc.mime_type = "audio/webm";
    desc.extension = "webm";
  } else {
    return false;
  }
  desc.filename = "voice-recording." + desc.extension;
  out = desc;
  return true;
}

}  // namespace voice_feature_cpp
