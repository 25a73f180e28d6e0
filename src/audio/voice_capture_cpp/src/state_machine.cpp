#include "voice_capture_cpp/state_machine.hpp"

using namespace std;


namespace voice_capture_cpp
{

string to_string(SessionState state)
{
  switch (state) {
    case SessionState::IDLE:
      return "idle";
    case SessionState::RECORDING:
      return "recording";
    case SessionState::STOPPING:
      return "stopping";
    case SessionState::FINISHED:
      return "finished";
    case SessionState::ERROR:
      return "error";
    default:
      return "unknown";
  }
}

StateMachine::StateMachine()
: state_(SessionState::IDLE)
{
}

SessionState StateMachine::state() const
{
  return state_;
}

string StateMachine::state_string() const
{
  return to_string(state_);
}

bool StateMachine::can_transition(SessionState next) const
{
  switch (state_) {
    case SessionState::IDLE:
      return next == SessionState::RECORDING || next == SessionState::ERROR;
    case SessionState::RECORDING:
      return next == SessionState::STOPPING;
    case SessionState::STOPPING:
      return next == SessionState::FINISHED;
    default:
      return false;
  }
}

bool StateMachine::transition_to(SessionState next)
{
  if (!can_transition(next)) {
    return false;
  }
  state_ = next;
  return true;
}

}  // namespace voice_capture_cpp
