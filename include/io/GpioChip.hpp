#pragma once
/** @file  GpioChip.hpp
 *  @brief Claim single GPIO lines as input or output on a Linux GPIO chip.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <stdexcept>
#include <string>

namespace fieldkit {
  namespace io {

    /// Raised by the GPIO layer on any driver/permission fault.
    class GpioError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    enum class Bias { None, PullUp, PullDown };

    /**
 * @class GpioLine
 * @brief One claimed line. Destroying the object releases the claim.
 *
 *  * Non-copyable (sole owner of the line handle).
 */
    class GpioLine {
    public:
      GpioLine() = default;
      virtual ~GpioLine() = default; ///< auto-release line

      virtual void set(bool high) = 0; ///< throws GpioError
      virtual bool get() = 0;          ///< physical level, throws GpioError
      virtual unsigned int offset() const = 0;

      GpioLine(const GpioLine&) = delete;
      GpioLine& operator=(const GpioLine&) = delete;
    };

    /**
 * @class GpioChip
 * @brief Factory for claimed lines on one chip (e.g. "/dev/gpiochip0").
 */
    class GpioChip {
    public:
      virtual ~GpioChip() = default;

      virtual std::unique_ptr<GpioLine> requestOutput(unsigned int line, bool initialHigh = false) = 0;
      virtual std::unique_ptr<GpioLine> requestInput(unsigned int line, Bias bias) = 0;

      virtual const std::string& path() const = 0;
    };

    /**
 * @class CharDevGpioChip
 * @brief GPIO character-device implementation (uAPI v2 ioctls).
 *
 *  * The chip node is opened per request and closed straight away, so a forked,
 *    privilege-dropped child opens it with its own credentials.
 */
    class CharDevGpioChip : public GpioChip {
    public:
      explicit CharDevGpioChip(std::string devPath, std::string consumer = "fieldkit");

      std::unique_ptr<GpioLine> requestOutput(unsigned int line, bool initialHigh = false) override;
      std::unique_ptr<GpioLine> requestInput(unsigned int line, Bias bias) override;

      const std::string& path() const override { return path_; }

    private:
      std::unique_ptr<GpioLine> request(unsigned int line, unsigned long long flags,
                                        bool setInitial, bool initialHigh);

      std::string path_;
      std::string consumer_;
    };

  } // namespace io
} // namespace fieldkit
