#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace voice_feature_cpp
{

constexpr size_t kFeatureCount = 22;

/// 하위 예측 로직이 소비하는 22개 음성 특징 (표준 이름은 upper-snake)
struct CanonicalVoiceFeatures
{
  double mdvp_fo = 0.0;
  double mdvp_fhi = 0.0;
  double mdvp_flo = 0.0;
  double mdvp_jitter = 0.0;
  double mdvp_jitter_abs = 0.0;
  double mdvp_rap = 0.0;
  double mdvp_ppq = 0.0;
  double jitter_ddp = 0.0;
  double mdvp_shimmer = 0.0;
  double mdvp_shimmer_db = 0.0;
  double shimmer_apq3 = 0.0;
  double shimmer_apq5 = 0.0;
  double mdvp_apq = 0.0;
  double shimmer_dda = 0.0;
  double nhr = 0.0;
  double hnr = 0.0;
  double rpde = 0.0;
  double dfa = 0.0;
  double spread1 = 0.0;
  double spread2 = 0.0;
  double d2 = 0.0;
  double ppe = 0.0;

  /// 원격 분석기의 camelCase 응답 → 표준 이름 매핑
  /// 원격에 대응 이름이 있는 필드는 필수, 로컬 전용 필드는 0
  /// 실패 시 false + error에 누락 필드 목록
  static bool from_remote_json(
    const std::string & body, CanonicalVoiceFeatures & out, std::string & error);

  /// 역방향: 원격에 대응 이름이 있는 13개 필드만 camelCase JSON 객체로
  std::string to_remote_json() const;
  /// 22개 필드 전체를 표준 이름 JSON 객체로
  std::string to_canonical_json() const;

  bool get(const std::string & canonical_name, double & out) const;
  bool set(const std::string & canonical_name, double value);
};

struct FeatureField
{
  const char * canonical_name;
  // 원격 분석기가 제공하지 않는 필드는 nullptr
  const char * remote_name;
  double CanonicalVoiceFeatures::* member;
};

const std::array<FeatureField, kFeatureCount> & feature_fields();

}  // namespace voice_feature_cpp
