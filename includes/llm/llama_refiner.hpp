#pragma once

#include "llm/text_refiner.hpp"

#include <memory>
#include <string>
#include <vector>
#include "llama.h"

namespace voiceflow {

class LlamaRefiner : public TextRefiner {
public:
    struct Config {
        std::string modelPath;
        int threadCount = 4;
        int contextSize = 2048;
        int maxOutputTokens = 512;
    };

    explicit LlamaRefiner(const Config& config);

    bool available() const override;
    bool init() override;
    void release() override;
    bool isReady() const override { return ctx_ != nullptr; }
    std::string refine(const std::string& transcript,
                       const std::optional<std::string>& context) override;
    const std::string& modelPath() const override { return config_.modelPath; }

private:
    struct ModelDeleter {
        void operator()(llama_model* p) { if (p) llama_model_free(p); }
    };
    struct ContextDeleter {
        void operator()(llama_context* p) { if (p) llama_free(p); }
    };
    struct SamplerDeleter {
        void operator()(llama_sampler* p) { if (p) llama_sampler_free(p); }
    };

    std::string buildPrompt(const std::string& transcript,
                            const std::optional<std::string>& context) const;
    std::vector<llama_token> tokenize(const std::string& text) const;
    std::string tokenToPiece(llama_token token) const;

    Config config_;
    // Declaration order is teardown order in reverse: sampler, context, model.
    std::unique_ptr<llama_model, ModelDeleter> model_;
    std::unique_ptr<llama_context, ContextDeleter> ctx_;
    std::unique_ptr<llama_sampler, SamplerDeleter> sampler_;
};

// llama.cpp keeps process-wide backend state. initLlamaBackend() is
// idempotent; shutdownLlamaBackend() frees it and a later init starts over.
void initLlamaBackend();
void shutdownLlamaBackend();
bool llamaBackendActive();

} // namespace voiceflow
