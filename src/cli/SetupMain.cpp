/* @file SetupMain.cpp
 * @brief fieldkit-setup: elevated system setup (root).
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "cli/Runtime.hpp"

int main(int argc, char** argv) {
  return fieldkit::cli::run(fieldkit::cli::Entrypoint::Setup, argc, argv);
}
