/**
 * @file pack_launcher.cpp
 * @brief PackLauncher implementation
 */

#include "Packwright/launcher/pack_launcher.hpp"
#include "Packwright/core/logger.hpp"
#include "Packwright/launcher/manifest_loader.hpp"
#include "Packwright/pipeline/orchestrator.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace Packwright::launcher {

namespace {

constexpr i32 kUsageExitCode = static_cast<i32>(pipeline::ExitCode::ConfigurationError);

std::string absoluteFromCwd(const std::string& path) {
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  return ec ? path : absolute.lexically_normal().string();
}

} // namespace

LaunchOptions PackLauncher::parseArgs(int argc, char* argv[]) {
  LaunchOptions opts;

  auto takeValue = [&](int& i, const std::string& flag, std::string& out) {
    if (i + 1 >= argc) {
      opts.usageError = "Option " + flag + " requires a value";
      return;
    }
    out = argv[++i];
  };

  for (int i = 1; i < argc && opts.usageError.empty(); ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--version") {
      opts.version = true;
    } else if (arg == "--manifest") {
      takeValue(i, arg, opts.manifestPath);
    } else if (arg == "--artifact") {
      takeValue(i, arg, opts.artifactOverride);
    } else if (arg == "--output") {
      takeValue(i, arg, opts.outputOverride);
    } else if (arg == "--log-file") {
      takeValue(i, arg, opts.logFile);
    } else if (arg == "--no-sign") {
      opts.noSign = true;
    } else if (arg == "--no-image") {
      opts.noImage = true;
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else if (arg == "--quiet" || arg == "-q") {
      opts.quiet = true;
    } else {
      opts.usageError = "Unknown option: " + arg;
    }
  }

  if (opts.usageError.empty() && opts.verbose && opts.quiet) {
    opts.usageError = "--verbose and --quiet cannot be combined";
  }
  return opts;
}

void PackLauncher::printVersion() {
  std::cout << "Packwright version " << PACKWRIGHT_VERSION_MAJOR << "."
            << PACKWRIGHT_VERSION_MINOR << "." << PACKWRIGHT_VERSION_PATCH << "\n";
  std::cout << "Application bundle and disk image packager\n";
}

void PackLauncher::printHelp(const char* programName) {
  std::cout << "Usage: " << programName << " [options]\n\n";
  std::cout << "Packwright - Assemble an application bundle and disk image.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --manifest <path>   Manifest file (default: " << kDefaultManifestName << ")\n";
  std::cout << "  --artifact <dir>    Override the build artifact directory\n";
  std::cout << "  --output <dir>      Override the output directory\n";
  std::cout << "  --no-sign           Skip code signing\n";
  std::cout << "  --no-image          Skip disk image creation\n";
  std::cout << "  --log-file <path>   Also write the log to a file\n";
  std::cout << "  -v, --verbose       Verbose logging\n";
  std::cout << "  -q, --quiet         Only log warnings and errors\n";
  std::cout << "  -h, --help          Show this help message\n";
  std::cout << "  --version           Show version information\n\n";
  std::cout << "Environment:\n";
  std::cout << "  " << pipeline::kDefaultPostProcessingEnv
            << "=1   Skip signing and disk image (nested builds)\n";
  std::cout << "  PACKWRIGHT_CODESIGN_PATH   Path to codesign\n";
  std::cout << "  PACKWRIGHT_HDIUTIL_PATH    Path to hdiutil\n";
}

Result<void> PackLauncher::initializeLogging(const LaunchOptions& options) {
  auto& logger = core::Logger::instance();

  if (options.verbose) {
    logger.setLevel(core::LogLevel::Debug);
  } else if (options.quiet) {
    logger.setLevel(core::LogLevel::Warning);
  } else {
    logger.setLevel(core::LogLevel::Info);
  }

  if (!options.logFile.empty()) {
    const fs::path logPath(options.logFile);
    std::error_code ec;
    if (logPath.has_parent_path()) {
      fs::create_directories(logPath.parent_path(), ec);
      if (ec) {
        return Result<void>::error("Failed to create log directory: " + ec.message());
      }
    }
    logger.setOutputFile(options.logFile);
    PACKWRIGHT_LOG_DEBUG("Logging to ", options.logFile);
  }
  return Result<void>::ok();
}

Result<pipeline::PipelineConfig> PackLauncher::loadConfig(const LaunchOptions& options) {
  const std::string manifestPath =
      options.manifestPath.empty() ? std::string(kDefaultManifestName) : options.manifestPath;

  auto loaded = ManifestLoader::loadFromFile(manifestPath);
  if (loaded.isError()) {
    return loaded;
  }

  pipeline::PipelineConfig config = std::move(loaded.value());
  if (!options.artifactOverride.empty()) {
    config.artifactDir = absoluteFromCwd(options.artifactOverride);
  }
  if (!options.outputOverride.empty()) {
    config.outputDir = absoluteFromCwd(options.outputOverride);
  }
  if (options.noSign) {
    config.signing.enabled = false;
  }
  if (options.noImage) {
    config.image.enabled = false;
  }

  auto validation = pipeline::validateConfig(config);
  if (validation.isError()) {
    return Result<pipeline::PipelineConfig>::error("Invalid configuration in " + manifestPath +
                                                   ": " + validation.error());
  }
  return Result<pipeline::PipelineConfig>::ok(std::move(config));
}

i32 PackLauncher::run(int argc, char* argv[]) {
  const LaunchOptions options = parseArgs(argc, argv);
  core::SystemClock clock;
  auto runner = platform::createProcessRunner();
  return run(options, clock, *runner, argc > 0 ? argv[0] : "packwright");
}

i32 PackLauncher::run(const LaunchOptions& options, core::IClock& clock,
                      platform::IProcessRunner& runner, const char* programName) {
  if (!options.usageError.empty()) {
    std::cerr << programName << ": " << options.usageError << "\n";
    std::cerr << "Try '" << programName << " --help' for more information.\n";
    return kUsageExitCode;
  }
  if (options.help) {
    printHelp(programName);
    return 0;
  }
  if (options.version) {
    printVersion();
    return 0;
  }

  auto logging = initializeLogging(options);
  if (logging.isError()) {
    std::cerr << programName << ": " << logging.error() << "\n";
    return kUsageExitCode;
  }

  auto config = loadConfig(options);
  if (config.isError()) {
    PACKWRIGHT_LOG_ERROR(config.error());
    return kUsageExitCode;
  }

  pipeline::Orchestrator orchestrator(std::move(config.value()), clock, runner);
  orchestrator.setOnStageComplete([](const pipeline::StageRecord& stage) {
    if (stage.skipped) {
      PACKWRIGHT_LOG_DEBUG("Stage ", stage.name, " skipped: ", stage.message);
    } else if (stage.success) {
      PACKWRIGHT_LOG_DEBUG("Stage ", stage.name, " finished in ",
                           static_cast<i64>(stage.durationMs), " ms");
    }
  });

  const auto report = orchestrator.run();
  for (const auto& warning : report.finalState.warnings) {
    PACKWRIGHT_LOG_DEBUG("Warning: ", warning);
  }

  core::Logger::instance().closeOutputFile();
  return static_cast<i32>(report.exitCode);
}

} // namespace Packwright::launcher
