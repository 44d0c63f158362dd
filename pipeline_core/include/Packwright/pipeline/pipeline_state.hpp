#pragma once

/**
 * @file pipeline_state.hpp
 * @brief State threaded through the packaging stages and the final report
 */

#include "Packwright/bundle/bundle_tree.hpp"
#include "Packwright/bundle/resource_collector.hpp"
#include "Packwright/core/types.hpp"
#include "Packwright/pipeline/external_tools.hpp"
#include "Packwright/pipeline/readiness_poller.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace Packwright::pipeline {

/**
 * @brief Process exit status of a packaging run
 */
enum class ExitCode : i32 {
  Success = 0,
  PipelineFailure = 1, // Artifact never ready, tree could not be built or published
  ConfigurationError = 2
};

/**
 * @brief Record of one executed (or skipped) stage
 */
struct StageRecord {
  std::string name;
  std::string description;
  bool success = true;
  bool skipped = false;
  std::string message;
  f64 durationMs = 0.0;
};

/**
 * @brief Everything the stages learn about the current run
 *
 * Each stage takes the state by value and returns the updated copy.
 */
struct PipelineState {
  bundle::BundleTree stagedTree;
  std::filesystem::path publishedBundle;
  std::filesystem::path diskImage;

  std::vector<bundle::ResourceEntry> collected;
  std::vector<bundle::ResourceEntry> accepted;
  std::vector<std::string> warnings;

  u32 excludedCount = 0;
  u32 rejectedCount = 0;
  u32 executableFilesCopied = 0;
  u32 resourcesCopied = 0;
  u32 resourceFailures = 0;
  u32 permissionsUpdated = 0;

  PollOutcome readiness;
  ToolOutcome signing;
  ToolOutcome image;
  std::string imageChecksum;

  bool postProcessingSuppressed = false;
  bool published = false;
};

struct PipelineReport {
  bool success = false;
  ExitCode exitCode = ExitCode::PipelineFailure;
  std::string errorMessage;
  std::vector<StageRecord> stages;
  PipelineState finalState;
  f64 totalDurationMs = 0.0;

  [[nodiscard]] const StageRecord* findStage(const std::string& name) const {
    for (const auto& stage : stages) {
      if (stage.name == name) {
        return &stage;
      }
    }
    return nullptr;
  }
};

} // namespace Packwright::pipeline
