/* @file InstallMain.cpp
 * @brief fieldkit-install: per-account user setup (must not be root).
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "cli/Runtime.hpp"

int main(int argc, char** argv) {
  return fieldkit::cli::run(fieldkit::cli::Entrypoint::Install, argc, argv);
}
