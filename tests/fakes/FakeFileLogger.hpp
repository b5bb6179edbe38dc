#pragma once
/** @file  FakeFileLogger.hpp
 *  @brief FileLogger that keeps rows in memory.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <sstream>
#include <string>
#include <vector>

#include "io/FileLogger.hpp"

namespace vsweep {
  namespace test {

    class FakeFileLogger : public vsweep::io::FileLogger {
    public:
      std::vector<std::string> rows;
      bool flushSucceeds = true;
      int flushes = 0;

      bool open(const std::string&, vsweep::io::OpenMode) override { return true; }
      void write(const std::string& csv) override { rows.push_back(csv); }
      bool flush() override {
        ++flushes;
        return flushSucceeds;
      }
      bool close() override { return true; }

      /// Comma-split row \p i (trailing '\n' removed; empty last field kept).
      std::vector<std::string> fields(std::size_t i) const {
        std::string line = rows.at(i);
        if (!line.empty() && line.back() == '\n')
          line.pop_back();
        std::vector<std::string> out;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, ','))
          out.push_back(field);
        if (!line.empty() && line.back() == ',')
          out.push_back("");
        return out;
      }

      std::string marker(std::size_t i) const { return fields(i).back(); }
    };

  } // namespace test
} // namespace vsweep
