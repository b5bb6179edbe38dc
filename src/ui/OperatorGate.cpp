/* @file OperatorGate.cpp
 * @brief console confirmation prompt
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <istream>
#include <ostream>

// 3rd-party headers
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "core/Errors.hpp"
#include "ui/OperatorGate.hpp"

using namespace vsweep::ui;

ConsoleGate::ConsoleGate(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

void ConsoleGate::waitForReady(const std::string& prompt) {
  out_ << '\n' << prompt << "\nPress SPACEBAR then ENTER when ready...\n" << std::flush;

  std::string answer;
  if (!std::getline(in_, answer))
    throw vsweep::core::TransportError("[ConsoleGate] operator input closed");

  spdlog::debug("[ConsoleGate] confirmed: '{}'", prompt);
}
