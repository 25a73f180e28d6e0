#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace voice_capture_cpp
{

class WavWriter
{
public:
  WavWriter();

  bool ensure_output_dir(const std::string & dir) const;
  std::string make_output_path(const std::string & dir, const std::string & filename) const;
  bool write_bytes(const std::string & file_path, const std::vector<uint8_t> & bytes) const;
};

}  // namespace voice_capture_cpp
