#pragma once

#include "ffi/handle.hpp"
#include "pipeline/pipeline.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace voiceflow::test {

// What FakePipeline does on its next call. Shared with the test so it can be
// changed after the pipeline has been handed to a VoiceFlowHandle.
struct FakeState {
    enum class Mode { Succeed, ThrowPipelineError, ThrowRuntimeError, ThrowNonStd };

    Mode mode = Mode::Succeed;
    std::string message;
    PipelineOutput output;

    int processCalls = 0;
    int formatCalls = 0;
    int unloadCalls = 0;
    size_t lastSampleCount = 0;
    std::optional<std::string> lastContext;
};

class FakePipeline : public Pipeline {
public:
    explicit FakePipeline(std::shared_ptr<FakeState> state) : state_(std::move(state)) {}

    PipelineOutput process(const float* /*samples*/, size_t numSamples,
                           const std::optional<std::string>& context) override {
        ++state_->processCalls;
        state_->lastSampleCount = numSamples;
        state_->lastContext = context;
        return respond();
    }

    PipelineOutput formatText(const std::string& /*text*/,
                              const std::optional<std::string>& context) override {
        ++state_->formatCalls;
        state_->lastContext = context;
        return respond();
    }

    void unloadModels() override {
        ++state_->unloadCalls;
        if (state_->mode == FakeState::Mode::ThrowRuntimeError) {
            throw std::runtime_error(state_->message);
        }
    }

private:
    PipelineOutput respond() {
        switch (state_->mode) {
        case FakeState::Mode::ThrowPipelineError:
            throw PipelineError(state_->message);
        case FakeState::Mode::ThrowRuntimeError:
            throw std::runtime_error(state_->message);
        case FakeState::Mode::ThrowNonStd:
            throw 42;
        case FakeState::Mode::Succeed:
            break;
        }
        return state_->output;
    }

    std::shared_ptr<FakeState> state_;
};

inline ffi::PipelineFactory fakeFactory(std::shared_ptr<FakeState> state) {
    return [state](const Config&) -> std::unique_ptr<Pipeline> {
        return std::make_unique<FakePipeline>(state);
    };
}

} // namespace voiceflow::test
