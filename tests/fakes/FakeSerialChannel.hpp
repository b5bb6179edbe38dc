#pragma once
/** @file  FakeSerialChannel.hpp
 *  @brief SerialChannel derivative with scripted device behaviour for stimulator / orchestrator testing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "io/SerialChannel.hpp"

namespace vsweep {
  namespace test {

    /// Shared between every channel a factory hands out, so presence checks and the
    /// controller's channel all see one "device".
    struct FakeDevice {
      int failOpens = 0; ///< opens that fail before the device "powers on"
      int opens = 0;
      int closes = 0;
      bool writeSucceeds = true;
      std::vector<std::string> written;
      std::deque<std::string> responses;

      /// Written payloads without the trailing '\n'.
      std::vector<std::string> commands() const {
        std::vector<std::string> out;
        for (const auto& w : written)
          out.push_back(!w.empty() && w.back() == '\n' ? w.substr(0, w.size() - 1) : w);
        return out;
      }
    };

    /**
 * @class FakeSerialChannel
 * @brief Never touches a tty; all I/O goes to the shared FakeDevice.
 */
    class FakeSerialChannel : public vsweep::io::SerialChannel {
    public:
      explicit FakeSerialChannel(std::shared_ptr<FakeDevice> device = std::make_shared<FakeDevice>())
          : device_(std::move(device)) {}

      bool open(const std::string&, speed_t) override {
        ++device_->opens;
        if (device_->failOpens > 0) {
          --device_->failOpens;
          return false;
        }
        open_ = true;
        return true;
      }

      bool writeLine(const std::string& line) override {
        if (!open_)
          return false;
        device_->written.push_back(line);
        return device_->writeSucceeds;
      }

      std::optional<std::string> readLine(std::chrono::milliseconds) override {
        if (!open_ || device_->responses.empty())
          return std::nullopt;
        std::string line = device_->responses.front();
        device_->responses.pop_front();
        return line;
      }

      void close() override {
        if (open_) {
          ++device_->closes;
          open_ = false;
        }
      }

      bool isOpen() const override { return open_; }

      const std::string& getLastWritten() const { return device_->written.back(); }

    private:
      std::shared_ptr<FakeDevice> device_;
      bool open_ = false;
    };

  } // namespace test
} // namespace vsweep
