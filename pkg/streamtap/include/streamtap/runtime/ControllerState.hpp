// Repository: StreamTap
// Component: ControllerState
// Purpose: Controller lifecycle states.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_RUNTIME_CONTROLLER_STATE_HPP_
#define STREAMTAP_RUNTIME_CONTROLLER_STATE_HPP_

namespace streamtap::runtime {

// Null → Ready → Paused → Playing → Stopping → Stopped. Stopping may be
// entered from any earlier state; Stopped is terminal.
enum class ControllerState {
  kNull = 0,
  kReady = 1,
  kPaused = 2,
  kPlaying = 3,
  kStopping = 4,
  kStopped = 5,
};

inline const char* ControllerStateName(ControllerState state) {
  switch (state) {
    case ControllerState::kNull: return "NULL";
    case ControllerState::kReady: return "READY";
    case ControllerState::kPaused: return "PAUSED";
    case ControllerState::kPlaying: return "PLAYING";
    case ControllerState::kStopping: return "STOPPING";
    case ControllerState::kStopped: return "STOPPED";
  }
  return "UNKNOWN";
}

}  // namespace streamtap::runtime

#endif  // STREAMTAP_RUNTIME_CONTROLLER_STATE_HPP_
