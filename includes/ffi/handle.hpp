#pragma once

#include "config/config.hpp"
#include "pipeline/pipeline.hpp"
#include "voiceflow/voiceflow.h"

#include <functional>
#include <memory>

// The opaque handle behind VoiceFlowHandle*. Exactly one owner: created by
// voiceflow_init, deleted by voiceflow_destroy.
struct VoiceFlowHandle {
    std::unique_ptr<voiceflow::Pipeline> pipeline;
};

namespace voiceflow::ffi {

using PipelineFactory = std::function<std::unique_ptr<Pipeline>(const Config&)>;

// Builds the pipeline for voiceflow_init. Defaults to VoicePipeline.
std::unique_ptr<Pipeline> createPipeline(const Config& config);

// Test hook: replace the factory used by voiceflow_init. An empty factory
// restores the default. Not thread-safe.
void setPipelineFactory(PipelineFactory factory);

} // namespace voiceflow::ffi
