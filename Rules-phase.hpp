#ifndef RULES_PHASE_DOT_HPP
#define RULES_PHASE_DOT_HPP

#include <cstdint>
#include <ostream>

namespace Rules {

// The SMTP conversation, in order.  'any' is "not specified."
enum class Phase : uint8_t {
  any,
  connect,
  helo,
  mail_from,
  rcpt_to,
  data,
  message,
};

constexpr char const* phase_c_str(Phase phase)
{
  switch (phase) { // clang-format off
  case Phase::any:       return "@any";
  case Phase::connect:   return "@connect";
  case Phase::helo:      return "@helo";
  case Phase::mail_from: return "@from";
  case Phase::rcpt_to:   return "@to";
  case Phase::data:      return "@data";
  case Phase::message:   return "@message";
  } // clang-format on
  return "*** unknown Phase ***";
}

// Weakest to strongest.  set_with is no verdict at all.
enum class Action : uint8_t {
  error,
  set_with,
  accept,
  stall,
  reject,
};

constexpr char const* action_c_str(Action action)
{
  switch (action) { // clang-format off
  case Action::error:    return "ERROR";
  case Action::set_with: return "set-with";
  case Action::accept:   return "accept";
  case Action::stall:    return "stall";
  case Action::reject:   return "reject";
  } // clang-format on
  return "*** unknown Action ***";
}

inline std::ostream& operator<<(std::ostream& os, Phase phase)
{
  return os << phase_c_str(phase);
}

inline std::ostream& operator<<(std::ostream& os, Action action)
{
  return os << action_c_str(action);
}

} // namespace Rules

#endif // RULES_PHASE_DOT_HPP
