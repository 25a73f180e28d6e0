#include "voice_sample_cpp/voice_sample_node.hpp"

#include <chrono>
#include <cstdlib>
#include <functional>
#include <utility>

using namespace std;


namespace voice_sample_cpp
{

using voice_capture_cpp::AudioPayload;
using voice_capture_cpp::DeliveryPath;
using voice_capture_cpp::SessionState;
using voice_feature_cpp::FeatureError;

/// 노드 초기화: 파라미터 로드 → 퍼블리셔/서브스크라이버 생성 → 전송 클라이언트 준비
VoiceSampleNode::VoiceSampleNode()
: Node("voice_sample_node"), max_record_seconds_(10), sample_rate_(16000),
  audio_device_index_(-1), delivery_("analysis"), raw_output_dir_("/tmp/voice_sample"),
  raw_filename_("voice-recording.wav"), upload_timeout_sec_(30), max_attempts_(3),
  retry_delay_ms_(1000), retry_client_errors_(false), check_health_on_start_(true),
  upload_busy_(false)
{
  declare_and_get_parameters();

  pub_state_ = create_publisher<std_msgs::msg::String>("/voice_sample/state", 10);
  pub_features_ = create_publisher<std_msgs::msg::String>("/voice_sample/features", 10);
  pub_error_ = create_publisher<std_msgs::msg::String>("/voice_sample/error", 10);
  pub_audio_path_ = create_publisher<std_msgs::msg::String>("/voice_sample/audio_path", 10);
  sub_record_ = create_subscription<std_msgs::msg::Bool>(
    "/voice_sample/record", 10,
    bind(&VoiceSampleNode::on_record, this, placeholders::_1));

  parameter_cb_handle_ = add_on_set_parameters_callback(
    bind(&VoiceSampleNode::on_set_parameters, this, placeholders::_1));

  rebuild_client();
  if (check_health_on_start_) {
    shared_ptr<voice_feature_cpp::FeatureTransportClient> client;
    {
      lock_guard<mutex> lock(client_mutex_);
      client = client_;
    }
    launch_worker([this, client]() { run_health_check(client); });
  }

  publish_state(SessionState::IDLE);
  RCLCPP_INFO(get_logger(), "voice_sample_cpp node started");
}

VoiceSampleNode::~VoiceSampleNode()
{
  {
    lock_guard<mutex> lock(worker_mutex_);
    if (upload_cancel_) {
      upload_cancel_->cancel();
    }
  }
  {
    // 녹음 중이면 payload 전달 없이 장치/타이머만 해제
    lock_guard<mutex> lock(session_mutex_);
    session_.reset();
  }
  lock_guard<mutex> lock(worker_mutex_);
  // reset 도중 타이머 스레드가 새 업로드를 시작했을 수 있음
  if (upload_cancel_) {
    upload_cancel_->cancel();
  }
  if (worker_.joinable()) {
    worker_.join();
  }
}

void VoiceSampleNode::declare_and_get_parameters()
{
  declare_parameter<string>("api_base_url", "http://localhost:8000");
  declare_parameter<string>("api_key", "");
  declare_parameter<int>("max_record_seconds", 10);
  declare_parameter<int>("sample_rate", 16000);
  declare_parameter<int>("audio_device_index", -1);
  // "analysis" = 특징 추출 서버로 업로드, "raw" = WAV 파일로 저장만
  declare_parameter<string>("delivery", "analysis");
  declare_parameter<string>("raw_output_dir", "/tmp/voice_sample");
  declare_parameter<string>("raw_filename", "voice-recording.wav");
  declare_parameter<int>("upload_timeout_sec", 30);
  declare_parameter<int>("max_attempts", 3);
  declare_parameter<int>("retry_delay_ms", 1000);
  declare_parameter<bool>("retry_client_errors", false);
  declare_parameter<bool>("check_health_on_start", true);

  api_base_url_ = get_parameter("api_base_url").as_string();
  api_key_ = get_parameter("api_key").as_string();
  max_record_seconds_ = static_cast<int>(get_parameter("max_record_seconds").as_int());
  sample_rate_ = static_cast<int>(get_parameter("sample_rate").as_int());
  audio_device_index_ = static_cast<int>(get_parameter("audio_device_index").as_int());
  delivery_ = get_parameter("delivery").as_string();
  raw_output_dir_ = get_parameter("raw_output_dir").as_string();
  raw_filename_ = get_parameter("raw_filename").as_string();
  upload_timeout_sec_ = static_cast<int>(get_parameter("upload_timeout_sec").as_int());
  max_attempts_ = static_cast<int>(get_parameter("max_attempts").as_int());
  retry_delay_ms_ = static_cast<int>(get_parameter("retry_delay_ms").as_int());
  retry_client_errors_ = get_parameter("retry_client_errors").as_bool();
  check_health_on_start_ = get_parameter("check_health_on_start").as_bool();

  // 파라미터에 키가 없으면 환경변수에서 가져옴
  if (api_key_.empty()) {
    const char * env_key = getenv("VOICE_ANALYZER_API_KEY");
    if (env_key) {
      api_key_ = env_key;
    }
  }
  if (api_key_.empty()) {
    RCLCPP_WARN(get_logger(), "api_key is empty. analyzer will likely reject uploads");
  }
  if (delivery_ != "analysis" && delivery_ != "raw") {
    RCLCPP_WARN(get_logger(), "unknown delivery '%s'. using analysis", delivery_.c_str());
    delivery_ = "analysis";
  }

  RCLCPP_INFO(
    get_logger(), "analyzer: %s delivery: %s max_record_seconds: %d",
    api_base_url_.c_str(), delivery_.c_str(), max_record_seconds_);
}

rcl_interfaces::msg::SetParametersResult VoiceSampleNode::on_set_parameters(
  const vector<rclcpp::Parameter> & parameters)
{
  auto result = rcl_interfaces::msg::SetParametersResult();
  result.successful = true;
  result.reason = "ok";

  bool client_changed = false;
  for (const auto & p : parameters) {
    const string & name = p.get_name();
    if (name == "max_record_seconds" && p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER) {
      const int value = static_cast<int>(p.as_int());
      if (value < 1 || value > 60) {
        result.successful = false;
        result.reason = "max_record_seconds must be 1..60";
        return result;
      }
      max_record_seconds_ = value;
    } else if (name == "max_attempts" && p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER) {
      const int value = static_cast<int>(p.as_int());
      if (value < 1 || value > 10) {
        result.successful = false;
        result.reason = "max_attempts must be 1..10";
        return result;
      }
      max_attempts_ = value;
      client_changed = true;
    } else if (name == "retry_delay_ms" && p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER) {
      const int value = static_cast<int>(p.as_int());
      if (value < 0) {
        result.successful = false;
        result.reason = "retry_delay_ms must be >= 0";
        return result;
      }
      retry_delay_ms_ = value;
      client_changed = true;
    } else if (name == "upload_timeout_sec" && p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER) {
      const int value = static_cast<int>(p.as_int());
      if (value < 1) {
        result.successful = false;
        result.reason = "upload_timeout_sec must be >= 1";
        return result;
      }
      upload_timeout_sec_ = value;
      client_changed = true;
    } else if (name == "retry_client_errors" && p.get_type() == rclcpp::ParameterType::PARAMETER_BOOL) {
      retry_client_errors_ = p.as_bool();
      client_changed = true;
    } else if (name == "api_base_url" && p.get_type() == rclcpp::ParameterType::PARAMETER_STRING) {
      api_base_url_ = p.as_string();
      client_changed = true;
    } else if (name == "api_key" && p.get_type() == rclcpp::ParameterType::PARAMETER_STRING) {
      api_key_ = p.as_string();
      client_changed = true;
    } else if (name == "delivery" && p.get_type() == rclcpp::ParameterType::PARAMETER_STRING) {
      if (p.as_string() != "analysis" && p.as_string() != "raw") {
        result.successful = false;
        result.reason = "delivery must be analysis or raw";
        return result;
      }
      delivery_ = p.as_string();
    } else if (name == "raw_output_dir" && p.get_type() == rclcpp::ParameterType::PARAMETER_STRING) {
      raw_output_dir_ = p.as_string();
    } else if (name == "raw_filename" && p.get_type() == rclcpp::ParameterType::PARAMETER_STRING) {
      if (p.as_string().empty()) {
        result.successful = false;
        result.reason = "raw_filename must not be empty";
        return result;
      }
      raw_filename_ = p.as_string();
    }
  }

  if (client_changed) {
    rebuild_client();
  }
  return result;
}

/// 진행 중인 업로드는 이전 클라이언트(shared_ptr)를 계속 사용
void VoiceSampleNode::rebuild_client()
{
  voice_feature_cpp::TransportConfig cfg;
  cfg.base_url = api_base_url_;
  cfg.api_key = api_key_;
  cfg.timeout_sec = upload_timeout_sec_;
  cfg.max_attempts = max_attempts_;
  cfg.retry_delay = chrono::milliseconds(retry_delay_ms_);
  cfg.retry_client_errors = retry_client_errors_;

  lock_guard<mutex> lock(client_mutex_);
  client_ = make_shared<voice_feature_cpp::FeatureTransportClient>(cfg);
}

void VoiceSampleNode::on_record(const std_msgs::msg::Bool::SharedPtr msg)
{
  if (msg->data) {
    start_session();
  } else {
    stop_session();
  }
}

/// 세션은 동시에 하나만. 녹음 중이거나 업로드 중이면 요청 거부
void VoiceSampleNode::start_session()
{
  lock_guard<mutex> lock(session_mutex_);
  if (session_) {
    const SessionState state = session_->state();
    if (state == SessionState::RECORDING || state == SessionState::STOPPING) {
      RCLCPP_WARN(get_logger(), "recording already in progress. ignore start request");
      publish_error("INVALID_STATE", "session is " + session_->state_string());
      return;
    }
  }
  if (upload_busy_.load()) {
    RCLCPP_WARN(get_logger(), "previous sample is still uploading. ignore start request");
    publish_error("INVALID_STATE", "upload in progress");
    return;
  }
  // 소멸자가 타이머 스레드를 join하므로, 직전 세션의 전달 콜백(업로드 시작)은 여기서 끝나 있음
  session_.reset();
  if (upload_busy_.load()) {
    RCLCPP_WARN(get_logger(), "previous sample is still uploading. ignore start request");
    publish_error("INVALID_STATE", "upload in progress");
    return;
  }

  if (!capture_.configure(audio_device_index_, sample_rate_, 1, 1024)) {
    publish_error("PERMISSION_DENIED", "invalid capture configuration");
    return;
  }

  voice_capture_cpp::SessionConfig cfg;
  cfg.max_record_seconds = max_record_seconds_;
  cfg.delivery = (delivery_ == "raw") ? DeliveryPath::RAW : DeliveryPath::ANALYSIS;
  cfg.raw_filename = raw_filename_;

  session_ = make_unique<voice_capture_cpp::RecordingSession>(capture_, tick_timer_, cfg);
  session_->set_state_callback(bind(&VoiceSampleNode::publish_state, this, placeholders::_1));
  session_->set_raw_handler(
    bind(&VoiceSampleNode::on_raw_payload, this, placeholders::_1, placeholders::_2));
  session_->set_analysis_handler(
    bind(&VoiceSampleNode::on_analysis_payload, this, placeholders::_1));

  if (!session_->start()) {
    RCLCPP_ERROR(get_logger(), "failed to start recording: %s", session_->last_error().c_str());
    publish_error("PERMISSION_DENIED", session_->last_error());
    return;
  }
  RCLCPP_INFO(
    get_logger(), "recording started: device=%d(%s) max=%ds",
    capture_.selected_device_index(), capture_.selected_device_name().c_str(),
    max_record_seconds_);
}

void VoiceSampleNode::stop_session()
{
  lock_guard<mutex> lock(session_mutex_);
  if (!session_) {
    return;
  }
  session_->stop();
}

/// 캡처 장치의 float PCM payload는 WAV로 감싸고, 그 외 타입은 그대로 전달
bool VoiceSampleNode::prepare_wav(const AudioPayload & payload, AudioPayload & out) const
{
  if (payload.media_type != voice_capture_cpp::kMediaTypePcmF32) {
    out = payload;
    return true;
  }

  voice_capture_cpp::RawAudioBuffer buffer;
  if (!voice_capture_cpp::decode_pcm_f32le(
      payload.data, static_cast<uint32_t>(capture_.sample_rate()),
      static_cast<uint16_t>(capture_.channels()), buffer))
  {
    return false;
  }
  out.data = wav_encoder_.encode(buffer);
  out.media_type = "audio/wav";
  return wav_validator_.validate(out.data);
}

void VoiceSampleNode::on_raw_payload(const AudioPayload & payload, const string & filename)
{
  AudioPayload wav;
  if (!prepare_wav(payload, wav)) {
    publish_error("VALIDATION_FAILURE", "captured audio could not be framed as WAV");
    return;
  }
  if (!wav_writer_.ensure_output_dir(raw_output_dir_)) {
    RCLCPP_WARN(get_logger(), "failed to create output dir: %s", raw_output_dir_.c_str());
  }

  const string file_path = wav_writer_.make_output_path(raw_output_dir_, filename);
  if (!wav_writer_.write_bytes(file_path, wav.data)) {
    RCLCPP_WARN(get_logger(), "failed to write audio file: %s", file_path.c_str());
    publish_error("WRITE_FAILED", "failed to write " + file_path);
    return;
  }

  std_msgs::msg::String msg;
  msg.data = file_path;
  pub_audio_path_->publish(msg);
  RCLCPP_INFO(get_logger(), "voice sample saved: %s (%zu bytes)", file_path.c_str(), wav.data.size());
}

void VoiceSampleNode::on_analysis_payload(const AudioPayload & payload)
{
  AudioPayload wav;
  if (!prepare_wav(payload, wav)) {
    publish_error(
      voice_feature_cpp::to_string(FeatureError::VALIDATION_FAILURE),
      "captured audio could not be framed as WAV");
    return;
  }

  shared_ptr<voice_feature_cpp::FeatureTransportClient> client;
  {
    lock_guard<mutex> lock(client_mutex_);
    client = client_;
  }
  auto cancel = make_shared<voice_feature_cpp::CancelToken>();
  upload_busy_.store(true);
  {
    lock_guard<mutex> lock(worker_mutex_);
    upload_cancel_ = cancel;
  }
  launch_worker([this, wav, client, cancel]() mutable {
      run_upload(move(wav), client, cancel);
    });
}

/// 업로드 전용 스레드: 재시도 포함 전체 전송 후 결과 발행
void VoiceSampleNode::run_upload(
  AudioPayload payload,
  shared_ptr<voice_feature_cpp::FeatureTransportClient> client,
  voice_feature_cpp::CancelTokenPtr cancel)
{
  RCLCPP_INFO(
    get_logger(), "uploading voice sample: %zu bytes (%s) to %s",
    payload.data.size(), payload.media_type.c_str(), client->analyze_url().c_str());

  const voice_feature_cpp::TransportResult result = client->analyze(payload, cancel.get());
  const int total = client->config().max_attempts;
  for (const auto & attempt : result.attempts) {
    if (attempt.ok) {
      RCLCPP_INFO(
        get_logger(), "attempt %d/%d http=%ld ok", attempt.attempt, total, attempt.http_code);
    } else {
      RCLCPP_WARN(
        get_logger(), "attempt %d/%d http=%ld error=%s %s",
        attempt.attempt, total, attempt.http_code,
        voice_feature_cpp::to_string(attempt.error).c_str(), attempt.message.c_str());
    }
  }

  if (result.ok) {
    std_msgs::msg::String msg;
    msg.data = result.features.to_canonical_json();
    pub_features_->publish(msg);
    RCLCPP_INFO(
      get_logger(), "voice features received: MDVP_Fo=%.3f HNR=%.3f PPE=%.4f",
      result.features.mdvp_fo, result.features.hnr, result.features.ppe);
  } else {
    RCLCPP_ERROR(
      get_logger(), "voice analysis failed: %s %s",
      voice_feature_cpp::to_string(result.error).c_str(), result.message.c_str());
    publish_error(voice_feature_cpp::to_string(result.error), result.message);
  }
  upload_busy_.store(false);
}

void VoiceSampleNode::run_health_check(
  shared_ptr<voice_feature_cpp::FeatureTransportClient> client)
{
  string error;
  if (client->check_health(error)) {
    RCLCPP_INFO(get_logger(), "analyzer reachable: %s", client->health_url().c_str());
  } else {
    RCLCPP_WARN(
      get_logger(), "analyzer health check failed (%s): %s",
      client->health_url().c_str(), error.c_str());
  }
}

/// 작업 스레드는 하나만 유지. 이전 작업이 끝난 스레드를 회수한 뒤 새 작업 시작
void VoiceSampleNode::launch_worker(function<void()> job)
{
  lock_guard<mutex> lock(worker_mutex_);
  if (worker_.joinable()) {
    worker_.join();
  }
  worker_ = thread(move(job));
}

void VoiceSampleNode::publish_state(SessionState state)
{
  std_msgs::msg::String msg;
  msg.data = voice_capture_cpp::to_string(state);
  pub_state_->publish(msg);
  RCLCPP_INFO(get_logger(), "state -> %s", msg.data.c_str());
}

void VoiceSampleNode::publish_error(const string & name, const string & message)
{
  std_msgs::msg::String msg;
  msg.data = name + ": " + message;
  pub_error_->publish(msg);
}

}  // namespace voice_sample_cpp

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  auto node = make_shared<voice_sample_cpp::VoiceSampleNode>();
  rclcpp::spin(node);
  rclcpp::shutdown();
  return 0;
}
