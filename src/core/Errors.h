#pragma once

#include <stdexcept>
#include <string>

// Malformed spawn / animation / config input. Fails the one call that hit it.
struct ConfigurationError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A PhysicsBody whose handle no longer resolves in the physics engine.
struct StaleHandleError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Duplicate component, self-damage and similar rejected mutations.
struct InvariantViolation : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Thrown by physics collaborators for any failing call.
struct PhysicsError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The engine step itself failed; simulation state can't be trusted afterwards.
struct PhysicsStepFailure : std::runtime_error {
  using std::runtime_error::runtime_error;
};
