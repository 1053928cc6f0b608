/* @file GpioTestMain.cpp
 * @brief fieldkit-gpio-test: standalone LED / button check.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "cli/Runtime.hpp"

int main(int argc, char** argv) {
  return fieldkit::cli::run(fieldkit::cli::Entrypoint::GpioTest, argc, argv);
}
