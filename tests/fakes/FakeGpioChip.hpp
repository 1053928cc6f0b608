#pragma once
/** @file  FakeGpioChip.hpp
 *  @brief GpioChip with scripted input levels and injectable faults.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "io/GpioChip.hpp"

namespace fieldkit {
  namespace test {

    /// Shared between the chip handles a factory hands out during one test.
    struct GpioScript {
      std::deque<bool> levels;       ///< consumed by get(); idleLevel afterwards
      bool idleLevel{ true };        ///< pulled-up, not pressed
      bool refuseRequest{ false };   ///< requestOutput/requestInput throw
      int failAfterWrites{ -1 };     ///< set() throws once this many writes happened
      std::vector<bool> writes;
      int claims{ 0 };
      int releases{ 0 };
      int reads{ 0 };
    };

    class FakeGpioLine : public io::GpioLine {
    public:
      FakeGpioLine(std::shared_ptr<GpioScript> script, unsigned int offset)
          : script_{ std::move(script) }, offset_{ offset } {
        ++script_->claims;
      }
      ~FakeGpioLine() override { ++script_->releases; }

      void set(bool high) override {
        if (script_->failAfterWrites >= 0 &&
            static_cast<int>(script_->writes.size()) >= script_->failAfterWrites)
          throw io::GpioError("simulated write fault on line " + std::to_string(offset_));
        script_->writes.push_back(high);
      }

      bool get() override {
        ++script_->reads;
        if (script_->levels.empty())
          return script_->idleLevel;
        const bool level = script_->levels.front();
        script_->levels.pop_front();
        return level;
      }

      unsigned int offset() const override { return offset_; }

    private:
      std::shared_ptr<GpioScript> script_;
      unsigned int offset_;
    };

    class FakeGpioChip : public io::GpioChip {
    public:
      explicit FakeGpioChip(std::shared_ptr<GpioScript> script) : script_{ std::move(script) } {}

      std::unique_ptr<io::GpioLine> requestOutput(unsigned int line, bool initialHigh) override {
        if (script_->refuseRequest)
          throw io::GpioError("simulated EACCES on " + path_);
        auto l = std::make_unique<FakeGpioLine>(script_, line);
        if (initialHigh)
          script_->writes.push_back(true);
        return l;
      }

      std::unique_ptr<io::GpioLine> requestInput(unsigned int line, io::Bias) override {
        if (script_->refuseRequest)
          throw io::GpioError("simulated EACCES on " + path_);
        return std::make_unique<FakeGpioLine>(script_, line);
      }

      const std::string& path() const override { return path_; }

    private:
      std::shared_ptr<GpioScript> script_;
      std::string path_{ "/dev/gpiochip-fake" };
    };

  } // namespace test
} // namespace fieldkit
