/**
 * @file packwright_main.cpp
 * @brief Packwright - Main Entry Point
 *
 * Usage:
 *   packwright                       # Package using ./packwright.json
 *   packwright --manifest <path>     # Use another manifest
 *   packwright --help                # Show help
 */

#include "Packwright/launcher/pack_launcher.hpp"

int main(int argc, char* argv[]) {
  Packwright::launcher::PackLauncher launcher;
  return launcher.run(argc, argv);
}
