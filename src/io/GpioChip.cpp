/* @file GpioChip.cpp
 * @brief GPIO character-device lines via the v2 uAPI (GPIO_V2_GET_LINE_IOCTL).
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror, strncpy

// Linux headers
#include <fcntl.h>
#include <linux/gpio.h>
#include <sys/ioctl.h>
#include <unistd.h>

// fieldkit headers
#include "io/GpioChip.hpp"

using namespace fieldkit::io;

namespace {

  std::string errnoText(const std::string& what) {
    return "[GpioChip] " + what + ": " + std::strerror(errno);
  }

  class CharDevLine : public GpioLine {
  public:
    CharDevLine(int fd, unsigned int offset) : fd_{ fd }, offset_{ offset } {}
    ~CharDevLine() override {
      if (fd_ >= 0)
        ::close(fd_);
    }

    void set(bool high) override {
      gpio_v2_line_values values{};
      values.mask = 1;
      values.bits = high ? 1 : 0;
      if (::ioctl(fd_, GPIO_V2_LINE_SET_VALUES_IOCTL, &values) < 0)
        throw GpioError(errnoText("set line " + std::to_string(offset_)));
    }

    bool get() override {
      gpio_v2_line_values values{};
      values.mask = 1;
      if (::ioctl(fd_, GPIO_V2_LINE_GET_VALUES_IOCTL, &values) < 0)
        throw GpioError(errnoText("read line " + std::to_string(offset_)));
      return (values.bits & 1) != 0;
    }

    unsigned int offset() const override { return offset_; }

  private:
    int fd_{ -1 }; ///< line request fd (-1 = released)
    unsigned int offset_;
  };

} // namespace

CharDevGpioChip::CharDevGpioChip(std::string devPath, std::string consumer)
    : path_{ std::move(devPath) }, consumer_{ std::move(consumer) } {}

std::unique_ptr<GpioLine> CharDevGpioChip::requestOutput(unsigned int line, bool initialHigh) {
  return request(line, GPIO_V2_LINE_FLAG_OUTPUT, true, initialHigh);
}

std::unique_ptr<GpioLine> CharDevGpioChip::requestInput(unsigned int line, Bias bias) {
  unsigned long long flags = GPIO_V2_LINE_FLAG_INPUT;
  switch (bias) {
  case Bias::PullUp:
    flags |= GPIO_V2_LINE_FLAG_BIAS_PULL_UP;
    break;
  case Bias::PullDown:
    flags |= GPIO_V2_LINE_FLAG_BIAS_PULL_DOWN;
    break;
  case Bias::None:
    flags |= GPIO_V2_LINE_FLAG_BIAS_DISABLED;
    break;
  }
  return request(line, flags, false, false);
}

std::unique_ptr<GpioLine> CharDevGpioChip::request(unsigned int line, unsigned long long flags,
                                                   bool setInitial, bool initialHigh) {
  int chipFd = ::open(path_.c_str(), O_RDWR | O_CLOEXEC);
  if (chipFd < 0)
    throw GpioError(errnoText("open " + path_));

  gpio_v2_line_request req{};
  req.offsets[0] = line;
  req.num_lines = 1;
  std::strncpy(req.consumer, consumer_.c_str(), GPIO_MAX_NAME_SIZE - 1);
  req.config.flags = flags;
  if (setInitial) {
    req.config.num_attrs = 1;
    req.config.attrs[0].attr.id = GPIO_V2_LINE_ATTR_ID_OUTPUT_VALUES;
    req.config.attrs[0].attr.values = initialHigh ? 1 : 0;
    req.config.attrs[0].mask = 1;
  }

  const int rc = ::ioctl(chipFd, GPIO_V2_GET_LINE_IOCTL, &req);
  const int savedErrno = errno;
  ::close(chipFd);
  if (rc < 0) {
    errno = savedErrno;
    throw GpioError(errnoText("claim line " + std::to_string(line) + " on " + path_));
  }
  return std::make_unique<CharDevLine>(req.fd, line);
}
