#pragma once
/** @file  OperatorGate.hpp
 *  @brief Blocking "operator is ready" confirmation points.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <iosfwd>
#include <string>
#include <utility>

namespace vsweep {
  namespace ui {

    /**
 * @class OperatorGate
 * @brief Suspends the sweep until someone outside the process says go.
 *
 * * No timeout: `waitForReady()` returns only on confirmation or throws.
 */
    class OperatorGate {
    public:
      virtual ~OperatorGate() = default;

      virtual void waitForReady(const std::string& prompt) = 0;
    };

    /**
 * @class ConsoleGate
 * @brief Prints the prompt and waits for one line on the input stream.
 *
 * * End of input throws `core::TransportError`.
 */
    class ConsoleGate : public OperatorGate {
    public:
      ConsoleGate(std::istream& in, std::ostream& out);

      void waitForReady(const std::string& prompt) override;

    private:
      std::istream& in_;
      std::ostream& out_;
    };

    /// Programmatic gate for automated runs and tests.
    class CallbackGate : public OperatorGate {
    public:
      explicit CallbackGate(std::function<void(const std::string&)> cb) : cb_(std::move(cb)) {}

      void waitForReady(const std::string& prompt) override {
        if (cb_)
          cb_(prompt);
      }

    private:
      std::function<void(const std::string&)> cb_{};
    };

  } // namespace ui
} // namespace vsweep
