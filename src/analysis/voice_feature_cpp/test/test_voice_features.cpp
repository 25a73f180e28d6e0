#include <gtest/gtest.h>

#include "voice_feature_cpp/media_type.hpp"
#include "voice_feature_cpp/voice_features.hpp"

#include <voice_common/json_utils.hpp>

#include <cmath>
#include <limits>
#include <set>
#include <string>

using namespace std;

namespace voice_feature_cpp
{
namespace
{

const char * kRemoteBody =
  R"({"mdvpFo": 150.2, "mdvpFhi": 180.1, "mdvpFlo": 120.5, "mdvpJitter": 0.004,
      "mdvpShimmer": 0.03, "nhr": 0.02, "hnr": 21.5, "rpde": 0.45, "dfa": 0.7,
      "spread1": -5.5, "spread2": 0.22, "d2": 2.3, "ppe": 0.2, "extra": "ignored"})";

TEST(CanonicalVoiceFeatures, MapsRemoteNamesAndZeroesLocalOnlyFields)
{
  CanonicalVoiceFeatures f;
  string error;
  ASSERT_TRUE(CanonicalVoiceFeatures::from_remote_json(kRemoteBody, f, error));

  EXPECT_DOUBLE_EQ(f.mdvp_fo, 150.2);
  EXPECT_DOUBLE_EQ(f.mdvp_jitter, 0.004);
  EXPECT_DOUBLE_EQ(f.spread1, -5.5);
  EXPECT_DOUBLE_EQ(f.ppe, 0.2);
  EXPECT_DOUBLE_EQ(f.mdvp_jitter_abs, 0.0);
  EXPECT_DOUBLE_EQ(f.shimmer_dda, 0.0);

  double value = -1.0;
  ASSERT_TRUE(f.get("MDVP_Fo", value));
  EXPECT_DOUBLE_EQ(value, 150.2);
  ASSERT_TRUE(f.get("MDVP_Jitter_Abs", value));
  EXPECT_DOUBLE_EQ(value, 0.0);
}

TEST(CanonicalVoiceFeatures, MissingRemoteFieldsAreListed)
{
  CanonicalVoiceFeatures f;
  f.mdvp_fo = 99.0;
  string error;
  EXPECT_FALSE(CanonicalVoiceFeatures::from_remote_json(
      R"({"mdvpFo": 1, "mdvpFhi": 2, "mdvpFlo": 3, "mdvpJitter": "0.1"})", f, error));
  EXPECT_EQ(
    error,
    "missing_fields:mdvpJitter,mdvpShimmer,nhr,hnr,rpde,dfa,spread1,spread2,d2,ppe");
  EXPECT_DOUBLE_EQ(f.mdvp_fo, 99.0);

  EXPECT_FALSE(CanonicalVoiceFeatures::from_remote_json("[]", f, error));
  EXPECT_EQ(error, "response_not_json_object");
}

TEST(CanonicalVoiceFeatures, NonFiniteRemoteValueIsMissing)
{
  string body = kRemoteBody;
  const string hnr = "\"hnr\": 21.5";
  body.replace(body.find(hnr), hnr.size(), "\"hnr\": NaN");

  CanonicalVoiceFeatures f;
  string error;
  EXPECT_FALSE(CanonicalVoiceFeatures::from_remote_json(body, f, error));
  EXPECT_EQ(error, "missing_fields:hnr");
}

TEST(CanonicalVoiceFeatures, FieldTableIsComplete)
{
  const auto & fields = feature_fields();
  set<string> canonical;
  int remote = 0;
  for (const auto & field : fields) {
    canonical.insert(field.canonical_name);
    if (field.remote_name != nullptr) {
      ++remote;
    }
  }
  EXPECT_EQ(canonical.size(), kFeatureCount);
  EXPECT_EQ(remote, 13);
}

TEST(CanonicalVoiceFeatures, RemoteJsonCarriesThirteenFields)
{
  CanonicalVoiceFeatures f;
  string error;
  ASSERT_TRUE(CanonicalVoiceFeatures::from_remote_json(kRemoteBody, f, error));
  f.mdvp_rap = 5.0;

  const string json = f.to_remote_json();
  double value = 0.0;
  ASSERT_TRUE(voice_common::extract_json_number_field(json, "hnr", value));
  EXPECT_DOUBLE_EQ(value, 21.5);
  EXPECT_EQ(json.find("MDVP_RAP"), string::npos);
  EXPECT_EQ(json.find("mdvpRap"), string::npos);

  CanonicalVoiceFeatures again;
  ASSERT_TRUE(CanonicalVoiceFeatures::from_remote_json(json, again, error));
  EXPECT_DOUBLE_EQ(again.d2, f.d2);
}

TEST(CanonicalVoiceFeatures, CanonicalJson)
{
  CanonicalVoiceFeatures f;
  ASSERT_TRUE(f.set("Shimmer_APQ5", 0.125));
  EXPECT_FALSE(f.set("shimmer_apq5", 1.0));
  f.hnr = numeric_limits<double>::quiet_NaN();

  const string json = f.to_canonical_json();
  double value = 0.0;
  ASSERT_TRUE(voice_common::extract_json_number_field(json, "Shimmer_APQ5", value));
  EXPECT_DOUBLE_EQ(value, 0.125);
  EXPECT_NE(json.find("\"HNR\":null"), string::npos);
  EXPECT_NE(json.find("\"PPE\":0"), string::npos);
}

TEST(MediaType, Normalization)
{
  MediaDescriptor d;
  ASSERT_TRUE(normalize_media_type("", d));
  EXPECT_EQ(d.mime_type, "audio/wav");
  EXPECT_TRUE(d.is_wav());

  ASSERT_TRUE(normalize_media_type("Audio/WebM; codecs=opus", d));
  EXPECT_EQ(d.mime_type, "audio/webm");
  EXPECT_EQ(d.filename, "voice-recording.webm");

  ASSERT_TRUE(normalize_media_type("audio/x-wav", d));
  EXPECT_EQ(d.extension, "wav");
  ASSERT_TRUE(normalize_media_type("wave", d));
  EXPECT_EQ(d.filename, "voice-recording.wav");

  EXPECT_FALSE(normalize_media_type("audio/ogg", d));
  EXPECT_FALSE(normalize_media_type("video/webm", d));
  EXPECT_FALSE(normalize_media_type("audio/", d));
}

}  // namespace
}  // namespace voice_feature_cpp
