#include "voice_capture_cpp/wav_writer.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

using namespace std;


namespace voice_capture_cpp
{

WavWriter::WavWriter() = default;

bool WavWriter::ensure_output_dir(const string & dir) const
{
  error_code ec;
  filesystem::create_directories(dir, ec);
  return !ec;
}

string WavWriter::make_output_path(const string & dir, const string & filename) const
{
  /// 녹음 시각(초 단위)을 호출자가 준 파일명 앞에 붙여 덮어쓰기 방지
  time_t now = time(nullptr);
  tm tm_now{};
  localtime_r(&now, &tm_now);

  ostringstream oss;
  oss << dir << "/" << put_time(&tm_now, "%Y%m%d_%H%M%S") << "_" << filename;
  return oss.str();
}

bool WavWriter::write_bytes(const string & file_path, const vector<uint8_t> & bytes) const
{
  ofstream out(file_path, ios::binary);
  if (!out.is_open()) {
    return false;
  }
  if (!bytes.empty()) {
    out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<streamsize>(bytes.size()));
  }
  return out.good();
}

}  // namespace voice_capture_cpp
