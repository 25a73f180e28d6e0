#pragma once

#include <string>

namespace voice_capture_cpp
{

enum class SessionState
{
  IDLE,
  RECORDING,
  STOPPING,
  FINISHED,
  ERROR
};

std::string to_string(SessionState state);

/// IDLE → RECORDING → STOPPING → FINISHED, IDLE → ERROR 만 허용
class StateMachine
{
public:
  StateMachine();

  SessionState state() const;
  std::string state_string() const;
  bool can_transition(SessionState next) const;
  bool transition_to(SessionState next);

private:
  SessionState state_;
};

}  // namespace voice_capture_cpp
