#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "rclcpp/rclcpp.hpp"
#include "rcl_interfaces/msg/set_parameters_result.hpp"
#include "std_msgs/msg/bool.hpp"
#include "std_msgs/msg/string.hpp"

#include "voice_capture_cpp/portaudio_capture.hpp"
#include "voice_capture_cpp/recording_session.hpp"
#include "voice_capture_cpp/tick_timer.hpp"
#include "voice_capture_cpp/wav_codec.hpp"
#include "voice_capture_cpp/wav_writer.hpp"
#include "voice_feature_cpp/cancel_token.hpp"
#include "voice_feature_cpp/feature_transport_client.hpp"

namespace voice_sample_cpp
{

class VoiceSampleNode : public rclcpp::Node
{
public:
  VoiceSampleNode();
  ~VoiceSampleNode() override;

private:
  void declare_and_get_parameters();
  rcl_interfaces::msg::SetParametersResult on_set_parameters(
    const std::vector<rclcpp::Parameter> & parameters);
  void rebuild_client();
  void on_record(const std_msgs::msg::Bool::SharedPtr msg);
  void start_session();
  void stop_session();
  bool prepare_wav(
    const voice_capture_cpp::AudioPayload & payload,
    voice_capture_cpp::AudioPayload & out) const;
  void on_raw_payload(const voice_capture_cpp::AudioPayload & payload, const std::string & filename);
  void on_analysis_payload(const voice_capture_cpp::AudioPayload & payload);
  void run_upload(
    voice_capture_cpp::AudioPayload payload,
    std::shared_ptr<voice_feature_cpp::FeatureTransportClient> client,
    voice_feature_cpp::CancelTokenPtr cancel);
  void run_health_check(std::shared_ptr<voice_feature_cpp::FeatureTransportClient> client);
  void launch_worker(std::function<void()> job);
  void publish_state(voice_capture_cpp::SessionState state);
  void publish_error(const std::string & name, const std::string & message);

  rclcpp::Subscription<std_msgs::msg::Bool>::SharedPtr sub_record_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_state_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_features_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_error_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_audio_path_;
  OnSetParametersCallbackHandle::SharedPtr parameter_cb_handle_;

  std::string api_base_url_;
  std::string api_key_;
  int max_record_seconds_;
  int sample_rate_;
  int audio_device_index_;
  std::string delivery_;
  std::string raw_output_dir_;
  std::string raw_filename_;
  int upload_timeout_sec_;
  int max_attempts_;
  int retry_delay_ms_;
  bool retry_client_errors_;
  bool check_health_on_start_;

  voice_capture_cpp::PortAudioCapture capture_;
  voice_capture_cpp::SteadyTickTimer tick_timer_;
  voice_capture_cpp::WavEncoder wav_encoder_;
  voice_capture_cpp::WavValidator wav_validator_;
  voice_capture_cpp::WavWriter wav_writer_;

  std::mutex session_mutex_;
  std::unique_ptr<voice_capture_cpp::RecordingSession> session_;

  std::mutex client_mutex_;
  std::shared_ptr<voice_feature_cpp::FeatureTransportClient> client_;

  std::mutex worker_mutex_;
  std::thread worker_;
  std::atomic<bool> upload_busy_;
  voice_feature_cpp::CancelTokenPtr upload_cancel_;
};

}  // namespace voice_sample_cpp
