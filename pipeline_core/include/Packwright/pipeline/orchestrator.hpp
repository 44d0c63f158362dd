#pragma once

/**
 * @file orchestrator.hpp
 * @brief Runs the packaging stages in order and reports on each of them
 *
 * Stage order:
 * 1. Clean      - remove the staging root left by an earlier run
 * 2. Collect    - discover resources
 * 3. Wait       - wait for the build artifact (fatal on timeout)
 * 4. Guard      - drop resources that point into our own output
 * 5. Assemble   - build the bundle tree in the staging root
 * 6. Normalize  - mark helper binaries executable
 * 7. Describe   - write Info.plist
 * 8. Sign       - optional, best effort
 * 9. Publish    - swap the staged bundle into the output directory
 * 10. Image     - optional disk image and checksum, best effort
 *
 * Sign and Image are skipped when the post-processing environment switch is
 * set, which lets the pipeline run inside another build without touching
 * signing identities or producing images.
 */

#include "Packwright/bundle/descriptor.hpp"
#include "Packwright/core/clock.hpp"
#include "Packwright/core/result.hpp"
#include "Packwright/pipeline/pipeline_config.hpp"
#include "Packwright/pipeline/pipeline_state.hpp"
#include "Packwright/platform/process_runner.hpp"

#include <functional>
#include <string>

namespace Packwright::pipeline {

namespace StageNames {
inline constexpr const char* kClean = "Clean";
inline constexpr const char* kCollect = "Collect";
inline constexpr const char* kWait = "Wait";
inline constexpr const char* kGuard = "Guard";
inline constexpr const char* kAssemble = "Assemble";
inline constexpr const char* kNormalize = "Normalize";
inline constexpr const char* kDescribe = "Describe";
inline constexpr const char* kSign = "Sign";
inline constexpr const char* kPublish = "Publish";
inline constexpr const char* kImage = "Image";
} // namespace StageNames

class Orchestrator {
public:
  Orchestrator(PipelineConfig config, core::IClock& clock, platform::IProcessRunner& runner);
  ~Orchestrator() = default;

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  /**
   * @brief Execute one packaging run
   *
   * Never throws. On a fatal stage failure the staging root is removed and
   * the report carries ExitCode::PipelineFailure.
   */
  [[nodiscard]] PipelineReport run();

  void setOnStageComplete(std::function<void(const StageRecord&)> callback);

  [[nodiscard]] const PipelineConfig& getConfig() const { return m_config; }

  /**
   * @brief Descriptor for the configured application
   */
  [[nodiscard]] static bundle::Descriptor buildDescriptor(const PipelineConfig& config);

  /**
   * @brief True when envVar is set to a truthy value (1, true, yes, on)
   */
  [[nodiscard]] static bool isPostProcessingSuppressed(const std::string& envVar);

private:
  using StageFn = Result<PipelineState> (Orchestrator::*)(PipelineState);

  bool runStage(const char* name, const char* description, StageFn stage, PipelineState& state,
                PipelineReport& report);
  void recordSkipped(const char* name, const char* description, const std::string& reason,
                     PipelineReport& report);
  void finishRecord(StageRecord record, PipelineReport& report);

  Result<PipelineState> cleanStage(PipelineState state);
  Result<PipelineState> collectStage(PipelineState state);
  Result<PipelineState> waitStage(PipelineState state);
  Result<PipelineState> guardStage(PipelineState state);
  Result<PipelineState> assembleStage(PipelineState state);
  Result<PipelineState> normalizeStage(PipelineState state);
  Result<PipelineState> describeStage(PipelineState state);
  Result<PipelineState> signStage(PipelineState state);
  Result<PipelineState> publishStage(PipelineState state);
  Result<PipelineState> imageStage(PipelineState state);

  void cleanup();

  PipelineConfig m_config;
  core::IClock& m_clock;
  platform::IProcessRunner& m_runner;

  // Annotations a stage may leave on its own record
  bool m_stageSkipped = false;
  std::string m_stageMessage;

  std::function<void(const StageRecord&)> m_onStageComplete;
};

} // namespace Packwright::pipeline
