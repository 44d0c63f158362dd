/**
 * @file orchestrator.cpp
 * @brief Orchestrator implementation
 */

#include "Packwright/pipeline/orchestrator.hpp"
#include "Packwright/bundle/bundle_assembler.hpp"
#include "Packwright/bundle/permission_normalizer.hpp"
#include "Packwright/bundle/recursion_guard.hpp"
#include "Packwright/bundle/resource_collector.hpp"
#include "Packwright/core/logger.hpp"
#include "Packwright/core/string_utils.hpp"
#include "Packwright/pipeline/artifact_checksum.hpp"
#include "Packwright/pipeline/external_tools.hpp"
#include "Packwright/pipeline/readiness_poller.hpp"

#include <cstdlib>
#include <exception>

namespace fs = std::filesystem;

namespace Packwright::pipeline {

namespace {

f64 millisecondsBetween(core::IClock::TimePoint start, core::IClock::TimePoint end) {
  return std::chrono::duration<f64, std::milli>(end - start).count();
}

void appendWarnings(PipelineState& state, const std::vector<std::string>& warnings) {
  state.warnings.insert(state.warnings.end(), warnings.begin(), warnings.end());
}

} // namespace

Orchestrator::Orchestrator(PipelineConfig config, core::IClock& clock,
                           platform::IProcessRunner& runner)
    : m_config(std::move(config)), m_clock(clock), m_runner(runner) {}

void Orchestrator::setOnStageComplete(std::function<void(const StageRecord&)> callback) {
  m_onStageComplete = std::move(callback);
}

bool Orchestrator::isPostProcessingSuppressed(const std::string& envVar) {
  if (envVar.empty()) {
    return false;
  }
  const char* value = std::getenv(envVar.c_str());
  return value != nullptr && core::isTruthy(value);
}

bundle::Descriptor Orchestrator::buildDescriptor(const PipelineConfig& config) {
  namespace keys = bundle::DescriptorKeys;

  bundle::Descriptor descriptor;
  descriptor.set(keys::kBundleName, config.appName);
  descriptor.set(keys::kDisplayName, config.appName);
  descriptor.set(keys::kIdentifier, config.identifier);
  descriptor.set(keys::kVersion, config.version);
  descriptor.set(keys::kShortVersion, effectiveShortVersion(config));
  descriptor.set(keys::kExecutable, effectiveExecutableName(config));
  descriptor.set(keys::kPackageType, std::string("APPL"));
  descriptor.set(keys::kInfoDictionaryVersion, std::string("6.0"));
  if (!config.minimumSystemVersion.empty()) {
    descriptor.set(keys::kMinimumSystemVersion, config.minimumSystemVersion);
  }
  descriptor.set(keys::kHighResolutionCapable, config.highResolutionCapable);
  if (!config.iconPath.empty()) {
    descriptor.set(keys::kIconFile, fs::path(config.iconPath).filename().string());
  }

  for (const auto& [key, value] : config.extraDescriptorKeys) {
    descriptor.set(key, value);
  }
  return descriptor;
}

// =============================================================================
// Run
// =============================================================================

PipelineReport Orchestrator::run() {
  PipelineReport report;
  const auto runStart = m_clock.now();

  auto validation = validateConfig(m_config);
  if (validation.isError()) {
    PACKWRIGHT_LOG_ERROR("Invalid configuration: ", validation.error());
    report.exitCode = ExitCode::ConfigurationError;
    report.errorMessage = validation.error();
    return report;
  }

  PipelineState state;
  state.postProcessingSuppressed = isPostProcessingSuppressed(m_config.postProcessingEnv);
  if (state.postProcessingSuppressed) {
    PACKWRIGHT_LOG_INFO(m_config.postProcessingEnv,
                        " is set; signing and disk image creation will be skipped");
  }

  PACKWRIGHT_LOG_INFO("Packaging ", bundleDirectoryName(m_config), " into ",
                      resolvedOutputDir(m_config).string());

  auto fail = [&](PipelineReport& failed) {
    cleanup();
    failed.exitCode = ExitCode::PipelineFailure;
    failed.finalState = state;
    failed.totalDurationMs = millisecondsBetween(runStart, m_clock.now());
    PACKWRIGHT_LOG_ERROR("Packaging failed: ", failed.errorMessage);
    return failed;
  };

  if (!runStage(StageNames::kClean, "Removing stale staging tree", &Orchestrator::cleanStage,
                state, report) ||
      !runStage(StageNames::kCollect, "Collecting resources", &Orchestrator::collectStage, state,
                report) ||
      !runStage(StageNames::kWait, "Waiting for build artifact", &Orchestrator::waitStage, state,
                report) ||
      !runStage(StageNames::kGuard, "Filtering recursion hazards", &Orchestrator::guardStage,
                state, report) ||
      !runStage(StageNames::kAssemble, "Assembling bundle tree", &Orchestrator::assembleStage,
                state, report) ||
      !runStage(StageNames::kNormalize, "Normalizing helper permissions",
                &Orchestrator::normalizeStage, state, report) ||
      !runStage(StageNames::kDescribe, "Writing bundle descriptor", &Orchestrator::describeStage,
                state, report)) {
    return fail(report);
  }

  if (state.postProcessingSuppressed) {
    recordSkipped(StageNames::kSign, "Signing bundle",
                  "Post-processing disabled by " + m_config.postProcessingEnv, report);
  } else if (!runStage(StageNames::kSign, "Signing bundle", &Orchestrator::signStage, state,
                       report)) {
    return fail(report);
  }

  if (!runStage(StageNames::kPublish, "Publishing bundle", &Orchestrator::publishStage, state,
                report)) {
    return fail(report);
  }

  if (state.postProcessingSuppressed) {
    recordSkipped(StageNames::kImage, "Creating disk image",
                  "Post-processing disabled by " + m_config.postProcessingEnv, report);
  } else if (!runStage(StageNames::kImage, "Creating disk image", &Orchestrator::imageStage,
                       state, report)) {
    return fail(report);
  }

  report.success = true;
  report.exitCode = ExitCode::Success;
  report.finalState = state;
  report.totalDurationMs = millisecondsBetween(runStart, m_clock.now());

  PACKWRIGHT_LOG_INFO("Packaging complete: ", state.publishedBundle.string(), " (",
                      state.resourcesCopied, " resources, ",
                      state.warnings.size(), " warnings)");
  return report;
}

bool Orchestrator::runStage(const char* name, const char* description, StageFn stage,
                            PipelineState& state, PipelineReport& report) {
  PACKWRIGHT_LOG_INFO("Starting: ", name, " - ", description);

  m_stageSkipped = false;
  m_stageMessage.clear();

  StageRecord record;
  record.name = name;
  record.description = description;

  const auto start = m_clock.now();
  std::string failure;
  try {
    auto result = (this->*stage)(state);
    if (result.isOk()) {
      state = std::move(result.value());
    } else {
      failure = result.error();
    }
  } catch (const fs::filesystem_error& e) {
    failure = e.what();
  } catch (const std::exception& e) {
    failure = std::string("Unexpected error: ") + e.what();
  }

  record.durationMs = millisecondsBetween(start, m_clock.now());
  record.skipped = m_stageSkipped;
  record.success = failure.empty();
  record.message = failure.empty() ? m_stageMessage : failure;

  if (!failure.empty()) {
    PACKWRIGHT_LOG_ERROR("Step failed: ", name, ": ", failure);
    report.errorMessage = failure;
  }

  finishRecord(std::move(record), report);
  return failure.empty();
}

void Orchestrator::recordSkipped(const char* name, const char* description,
                                 const std::string& reason, PipelineReport& report) {
  PACKWRIGHT_LOG_INFO("Skipping: ", name, " - ", reason);

  StageRecord record;
  record.name = name;
  record.description = description;
  record.skipped = true;
  record.message = reason;
  finishRecord(std::move(record), report);
}

void Orchestrator::finishRecord(StageRecord record, PipelineReport& report) {
  report.stages.push_back(std::move(record));
  if (m_onStageComplete) {
    m_onStageComplete(report.stages.back());
  }
}

void Orchestrator::cleanup() {
  const fs::path staging = resolvedStagingDir(m_config);
  std::error_code ec;
  fs::remove_all(staging, ec);
  if (ec) {
    PACKWRIGHT_LOG_WARN("Failed to remove staging directory ", staging.string(), ": ",
                        ec.message());
  }
}

// =============================================================================
// Stages
// =============================================================================

Result<PipelineState> Orchestrator::cleanStage(PipelineState state) {
  const fs::path staging = resolvedStagingDir(m_config);
  std::error_code ec;
  const auto removed = fs::remove_all(staging, ec);
  if (ec) {
    return Result<PipelineState>::error("Cannot remove staging directory " + staging.string() +
                                        ": " + ec.message());
  }
  if (removed > 0) {
    m_stageMessage = "Removed " + std::to_string(removed) + " stale entries";
  }
  return Result<PipelineState>::ok(std::move(state));
}

Result<PipelineState> Orchestrator::collectStage(PipelineState state) {
  bundle::ResourceCollector collector(resolvedProjectRoot(m_config),
                                      bundle::ExclusionSet(m_config.excludedResourceNames));
  auto collection = collector.collect(m_config.resources);

  state.collected = std::move(collection.entries);
  state.excludedCount = collection.excludedCount;
  appendWarnings(state, collection.warnings);

  m_stageMessage = std::to_string(state.collected.size()) + " resources collected, " +
                   std::to_string(state.excludedCount) + " excluded";
  PACKWRIGHT_LOG_INFO(m_stageMessage);
  return Result<PipelineState>::ok(std::move(state));
}

Result<PipelineState> Orchestrator::waitStage(PipelineState state) {
  BuildArtifact artifact{resolvedArtifactDir(m_config), effectiveExecutableName(m_config)};

  PollPolicy policy;
  policy.maxAttempts = m_config.readiness.maxAttempts;
  policy.interval = std::chrono::milliseconds(m_config.readiness.intervalMs);
  policy.deadline = std::chrono::milliseconds(m_config.readiness.deadlineMs);

  ReadinessPoller poller(policy, m_clock);
  state.readiness = poller.waitFor(artifact);

  if (state.readiness.state != PollerState::Ready) {
    return Result<PipelineState>::error(
        "Build artifact not ready after " + std::to_string(state.readiness.attempts) +
        " attempts: " + artifact.executablePath().string());
  }

  m_stageMessage = "Artifact ready after " + std::to_string(state.readiness.attempts) +
                   (state.readiness.attempts == 1 ? " attempt" : " attempts");
  return Result<PipelineState>::ok(std::move(state));
}

Result<PipelineState> Orchestrator::guardStage(PipelineState state) {
  bundle::RecursionRoots roots;
  roots.publishedBundle = publishedBundlePath(m_config);
  roots.stagingRoot = resolvedStagingDir(m_config);
  roots.bundleName = bundleDirectoryName(m_config);
  roots.ownArtifacts = {diskImagePath(m_config), checksumPath(m_config)};

  bundle::RecursionGuard guard(std::move(roots));
  auto guarded = guard.filter(state.collected);

  state.accepted = std::move(guarded.entries);
  state.rejectedCount = guarded.rejectedCount;

  if (state.rejectedCount > 0) {
    m_stageMessage = std::to_string(state.rejectedCount) + " entries pointed into the output";
  }
  return Result<PipelineState>::ok(std::move(state));
}

Result<PipelineState> Orchestrator::assembleStage(PipelineState state) {
  bundle::BundleTree tree;
  tree.root = stagedBundlePath(m_config);
  bundle::BundleAssembler assembler(tree);

  auto treeResult = assembler.createTree();
  if (treeResult.isError()) {
    return Result<PipelineState>::error(treeResult.error());
  }

  auto executableResult = assembler.copyExecutable(resolvedArtifactDir(m_config));
  if (executableResult.isError()) {
    return Result<PipelineState>::error(executableResult.error());
  }
  state.executableFilesCopied = executableResult.value();

  auto copyReport = assembler.copyResources(state.accepted);
  state.resourcesCopied = copyReport.copiedCount;
  state.resourceFailures = copyReport.failedCount;
  appendWarnings(state, copyReport.failures);

  if (!m_config.iconPath.empty()) {
    auto iconResult = assembler.copyIcon(resolvePath(m_config, m_config.iconPath));
    if (iconResult.isError()) {
      PACKWRIGHT_LOG_WARN(iconResult.error());
      state.warnings.push_back(iconResult.error());
    }
  }

  state.stagedTree = tree;
  m_stageMessage = std::to_string(state.resourcesCopied) + " resources copied";
  if (state.resourceFailures > 0) {
    m_stageMessage += ", " + std::to_string(state.resourceFailures) + " failed";
  }
  return Result<PipelineState>::ok(std::move(state));
}

Result<PipelineState> Orchestrator::normalizeStage(PipelineState state) {
  std::vector<fs::path> directories;
  directories.reserve(m_config.helperDirectories.size());
  for (const auto& helper : m_config.helperDirectories) {
    directories.push_back(state.stagedTree.resourcesDir() / helper);
  }

  bundle::PermissionNormalizer normalizer(m_config.permissionBits);
  auto normalizeReport = normalizer.normalize(directories);

  state.permissionsUpdated = normalizeReport.filesUpdated;
  appendWarnings(state, normalizeReport.failures);

  m_stageMessage = std::to_string(normalizeReport.filesUpdated) + " files set to " +
                   formatPermissionBits(m_config.permissionBits);
  return Result<PipelineState>::ok(std::move(state));
}

Result<PipelineState> Orchestrator::describeStage(PipelineState state) {
  const auto descriptor = buildDescriptor(m_config);

  const auto missing = descriptor.missingRequiredKeys();
  if (!missing.empty()) {
    std::string list;
    for (const auto& key : missing) {
      list += (list.empty() ? "" : ", ") + key;
    }
    return Result<PipelineState>::error("Descriptor is missing required keys: " + list);
  }

  auto writeResult = descriptor.writeTo(state.stagedTree.descriptorPath());
  if (writeResult.isError()) {
    return Result<PipelineState>::error(writeResult.error());
  }
  return Result<PipelineState>::ok(std::move(state));
}

Result<PipelineState> Orchestrator::signStage(PipelineState state) {
  if (!m_config.signing.enabled) {
    m_stageSkipped = true;
    m_stageMessage = "Signing disabled";
    state.signing.status = ToolStatus::Skipped;
    state.signing.message = m_stageMessage;
    return Result<PipelineState>::ok(std::move(state));
  }

  SigningOptions options;
  options.identity = m_config.signing.identity;
  options.hardenedRuntime = m_config.signing.hardenedRuntime;
  options.toolPath = m_config.signing.toolPath;
  if (!m_config.signing.entitlements.empty()) {
    options.entitlements = resolvePath(m_config, m_config.signing.entitlements).string();
  }

  ExternalToolInvoker invoker(m_runner);
  state.signing = invoker.signBundle(state.stagedTree.root, options);

  m_stageSkipped = state.signing.status == ToolStatus::Skipped;
  m_stageMessage = state.signing.message;
  if (!state.signing.succeeded()) {
    state.warnings.push_back("Bundle left unsigned: " + state.signing.message);
  }
  return Result<PipelineState>::ok(std::move(state));
}

Result<PipelineState> Orchestrator::publishStage(PipelineState state) {
  const fs::path staged = state.stagedTree.root;
  const fs::path published = publishedBundlePath(m_config);
  std::error_code ec;

  fs::create_directories(published.parent_path(), ec);
  if (ec) {
    return Result<PipelineState>::error("Cannot create output directory " +
                                        published.parent_path().string() + ": " + ec.message());
  }

  fs::remove_all(published, ec);
  if (ec) {
    return Result<PipelineState>::error("Cannot remove previous bundle " + published.string() +
                                        ": " + ec.message());
  }

  fs::rename(staged, published, ec);
  if (ec) {
    // Staging may live on another filesystem
    PACKWRIGHT_LOG_DEBUG("Rename failed (", ec.message(), "), copying bundle instead");
    ec.clear();
    fs::copy(staged, published, fs::copy_options::recursive | fs::copy_options::copy_symlinks,
             ec);
    if (ec) {
      std::error_code cleanupEc;
      fs::remove_all(published, cleanupEc);
      return Result<PipelineState>::error("Cannot publish bundle to " + published.string() + ": " +
                                          ec.message());
    }
  }

  cleanup();

  state.publishedBundle = published;
  state.published = true;
  m_stageMessage = published.string();
  PACKWRIGHT_LOG_INFO("Bundle published: ", published.string());
  return Result<PipelineState>::ok(std::move(state));
}

Result<PipelineState> Orchestrator::imageStage(PipelineState state) {
  if (!m_config.image.enabled) {
    m_stageSkipped = true;
    m_stageMessage = "Disk image disabled";
    state.image.status = ToolStatus::Skipped;
    state.image.message = m_stageMessage;
    return Result<PipelineState>::ok(std::move(state));
  }

  const fs::path imagePath = diskImagePath(m_config);
  const fs::path sumPath = checksumPath(m_config);

  // A checksum from an earlier image must never sit beside a new one
  std::error_code ec;
  fs::remove(sumPath, ec);
  if (ec) {
    PACKWRIGHT_LOG_WARN("Cannot remove old checksum ", sumPath.string(), ": ", ec.message());
  }

  ImageOptions options;
  options.volumeName = effectiveVolumeName(m_config);
  options.format = m_config.image.format;
  options.toolPath = m_config.image.toolPath;

  ExternalToolInvoker invoker(m_runner);
  state.image = invoker.createDiskImage(state.publishedBundle, imagePath, options);

  m_stageSkipped = state.image.status == ToolStatus::Skipped;
  m_stageMessage = state.image.message;

  if (!state.image.succeeded()) {
    state.warnings.push_back("No disk image produced: " + state.image.message);
    return Result<PipelineState>::ok(std::move(state));
  }

  state.diskImage = imagePath;
  if (m_config.image.writeChecksum) {
    auto checksum = writeChecksumFile(imagePath, sumPath);
    if (checksum.isError()) {
      PACKWRIGHT_LOG_WARN("Checksum not written: ", checksum.error());
      state.warnings.push_back(checksum.error());
    } else {
      state.imageChecksum = checksum.value();
      PACKWRIGHT_LOG_INFO("SHA-256 ", state.imageChecksum, "  ",
                          imagePath.filename().string());
    }
  }
  return Result<PipelineState>::ok(std::move(state));
}

} // namespace Packwright::pipeline
