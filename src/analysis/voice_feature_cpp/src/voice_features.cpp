#include "voice_feature_cpp/voice_features.hpp"

#include <voice_common/json_utils.hpp>

#include <cmath>
#include <sstream>

using namespace std;


namespace voice_feature_cpp
{

namespace
{
using F = CanonicalVoiceFeatures;

const array<FeatureField, kFeatureCount> kFields = {{
  {"MDVP_Fo", "mdvpFo", &F::mdvp_fo},
  {"MDVP_Fhi", "mdvpFhi", &F::mdvp_fhi},
  {"MDVP_Flo", "mdvpFlo", &F::mdvp_flo},
  {"MDVP_Jitter", "mdvpJitter", &F::mdvp_jitter},
  {"MDVP_Jitter_Abs", nullptr, &F::mdvp_jitter_abs},
  {"MDVP_RAP", nullptr, &F::mdvp_rap},
  {"MDVP_PPQ", nullptr, &F::mdvp_ppq},
  {"Jitter_DDP", nullptr, &F::jitter_ddp},
  {"MDVP_Shimmer", "mdvpShimmer", &F::mdvp_shimmer},
  {"MDVP_Shimmer_dB", nullptr, &F::mdvp_shimmer_db},
  {"Shimmer_APQ3", nullptr, &F::shimmer_apq3},
  {"Shimmer_APQ5", nullptr, &F::shimmer_apq5},
  {"MDVP_APQ", nullptr, &F::mdvp_apq},
  {"Shimmer_DDA", nullptr, &F::shimmer_dda},
  {"NHR", "nhr", &F::nhr},
  {"HNR", "hnr", &F::hnr},
  {"RPDE", "rpde", &F::rpde},
  {"DFA", "dfa", &F::dfa},
  {"spread1", "spread1", &F::spread1},
  {"spread2", "spread2", &F::spread2},
  {"D2", "d2", &F::d2},
  {"PPE", "ppe", &F::ppe},
}};

void append_number(ostringstream & oss, double value)
{
  // JSON에는 NaN/Inf 표현이 없음
  if (!std::isfinite(value)) {
    oss << "null";
    return;
  }
  oss << value;
}
}  // namespace

const array<FeatureField, kFeatureCount> & feature_fields()
{
  return kFields;
}

bool CanonicalVoiceFeatures::from_remote_json(
  const string & body, CanonicalVoiceFeatures & out, string & error)
{
  if (!voice_common::looks_like_json_object(body)) {
    error = "response_not_json_object";
    return false;
  }

  CanonicalVoiceFeatures features;
  string missing;
  for (const auto & field : kFields) {
    if (field.remote_name == nullptr) {
      continue;
    }
    double value = 0.0;
    if (!voice_common::extract_json_number_field(body, field.remote_name, value)) {
      if (!missing.empty()) {
        missing += ",";
      }
      missing += field.remote_name;
      continue;
    }
    features.*(field.member) = value;
  }

  if (!missing.empty()) {
    error = "missing_fields:" + missing;
    return false;
  }
  out = features;
  return true;
}

string CanonicalVoiceFeatures::to_remote_json() const
{
  ostringstream oss;
  oss.precision(15);
  oss << "{";
  bool first = true;
  for (const auto & field : kFields) {
    if (field.remote_name == nullptr) {
      continue;
    }
    if (!first) {
      oss << ",";
    }
    first = false;
    oss << "\"" << field.remote_name << "\":";
    append_number(oss, this->*(field.member));
  }
  oss << "}";
  return oss.str();
}

string CanonicalVoiceFeatures::to_canonical_json() const
{
  ostringstream oss;
  oss.precision(15);
  oss << "{";
  for (size_t i = 0; i < kFields.size(); ++i) {
    if (i > 0) {
      oss << ",";
    }
    oss << "\"" << kFields[i].canonical_name << "\":";
    append_number(oss, this->*(kFields[i].member));
  }
  oss << "}";
  return oss.str();
}

bool CanonicalVoiceFeatures::get(const string & canonical_name, double & out) const
{
  for (const auto & field : kFields) {
    if (canonical_name == field.canonical_name) {
      out = this->*(field.member);
      return true;
    }
  }
  return false;
}

bool CanonicalVoiceFeatures::set(const string & canonical_name, double value)
{
  for (const auto & field : kFields) {
    if (canonical_name == field.canonical_name) {
      this->*(field.member) = value;
      return true;
    }
  }
  return false;
}

}  // namespace voice_feature_cpp
