#ifndef MATCHING_ERRORS_HPP
#define MATCHING_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Matching {

// The automaton was driven out of order: searched before compile(), compiled
// twice, or extended after compilation
class AutomatonUsageError : public std::logic_error {
public:
  explicit AutomatonUsageError(const std::string &what)
      : std::logic_error(what) {}
};

// A matched pattern has no registered label. Unreachable unless the builder
// and the label map went out of sync
class LabelLookupError : public std::logic_error {
public:
  explicit LabelLookupError(const std::string &what)
      : std::logic_error(what) {}
};

} // namespace Matching

#endif // MATCHING_ERRORS_HPP
