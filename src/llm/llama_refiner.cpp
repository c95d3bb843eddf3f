#include "llm/llama_refiner.hpp"
#include "log/debug_log.hpp"

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <stdexcept>

namespace voiceflow {

namespace {

const char* const kSystemPrompt =
    "You clean up dictated speech. Fix punctuation, capitalization and obvious "
    "recognition errors, and drop filler words and false starts. Keep the speaker's "
    "wording and language. Never answer, summarize or add anything. "
    "Reply with the cleaned text only.";

std::mutex& backendMutex() {
    static std::mutex m;
    return m;
}

bool& backendActive() {
    static bool active = false;
    return active;
}

void forwardLlamaLog(ggml_log_level level, const char* text, void* /*userData*/) {
    if (!text || level < GGML_LOG_LEVEL_WARN) return;
    std::string line(text);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    if (!line.empty()) debugLog("llama: " + line);
}

// Reasoning models (Qwen3) may wrap a thought block around the answer.
std::string stripThinking(std::string text) {
    const std::string open = "<think>";
    const std::string close = "</think>";
    for (auto start = text.find(open); start != std::string::npos; start = text.find(open)) {
        const auto end = text.find(close, start);
        if (end == std::string::npos) {
            text.erase(start);
            break;
        }
        text.erase(start, end + close.size() - start);
    }
    return text;
}

std::string trimmed(const std::string& s) {
    const auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

void initLlamaBackend() {
    std::lock_guard<std::mutex> lock(backendMutex());
    if (backendActive()) return;
    llama_backend_init();
    llama_log_set(forwardLlamaLog, nullptr);
    backendActive() = true;
    debugLog("llama backend initialized");
}

void shutdownLlamaBackend() {
    std::lock_guard<std::mutex> lock(backendMutex());
    if (!backendActive()) return;
    llama_backend_free();
    backendActive() = false;
    debugLog("llama backend freed");
}

bool llamaBackendActive() {
    std::lock_guard<std::mutex> lock(backendMutex());
    return backendActive();
}

LlamaRefiner::LlamaRefiner(const Config& config) : config_(config) {}

bool LlamaRefiner::available() const {
    std::error_code ec;
    return !config_.modelPath.empty() &&
           std::filesystem::is_regular_file(config_.modelPath, ec);
}

bool LlamaRefiner::init() {
    if (ctx_) return true;

    if (!available()) {
        debugLog("LLM model not found: " + config_.modelPath);
        return false;
    }

    initLlamaBackend();

    debugLog("Loading LLM model from: " + config_.modelPath);
    llama_model_params modelParams = llama_model_default_params();
    model_.reset(llama_model_load_from_file(config_.modelPath.c_str(), modelParams));
    if (!model_) {
        debugLog("Failed to load LLM model: " + config_.modelPath);
        return false;
    }

    llama_context_params ctxParams = llama_context_default_params();
    ctxParams.n_ctx = static_cast<uint32_t>(config_.contextSize);
    ctxParams.n_batch = static_cast<uint32_t>(config_.contextSize);
    ctxParams.n_threads = config_.threadCount;
    ctxParams.n_threads_batch = config_.threadCount;
    ctxParams.no_perf = true;
    ctx_.reset(llama_init_from_model(model_.get(), ctxParams));
    if (!ctx_) {
        debugLog("Failed to create LLM context for " + config_.modelPath);
        model_.reset();
        return false;
    }

    // Deterministic: the same dictation always formats the same way.
    llama_sampler_chain_params samplerParams = llama_sampler_chain_default_params();
    samplerParams.no_perf = true;
    sampler_.reset(llama_sampler_chain_init(samplerParams));
    llama_sampler_chain_add(sampler_.get(), llama_sampler_init_greedy());

    debugLog("LLM model loaded, context " + std::to_string(llama_n_ctx(ctx_.get())));
    return true;
}

void LlamaRefiner::release() {
    sampler_.reset();
    ctx_.reset();
    model_.reset();
}

std::string LlamaRefiner::buildPrompt(const std::string& transcript,
                                      const std::optional<std::string>& context) const {
    std::string user;
    if (context && !trimmed(*context).empty()) {
        user = "Text before the cursor:\n" + *context + "\n\n";
    }
    user += "Transcript:\n" + transcript;

    const llama_chat_message messages[] = {
        {"system", kSystemPrompt},
        {"user", user.c_str()},
    };
    const char* tmpl = llama_model_chat_template(model_.get(), nullptr);
    if (!tmpl) {
        return std::string(kSystemPrompt) + "\n\n" + user + "\n\nCleaned text:\n";
    }

    std::string prompt(1024 + user.size() * 2, '\0');
    int32_t len = llama_chat_apply_template(tmpl, messages, 2, true,
                                            prompt.data(), static_cast<int32_t>(prompt.size()));
    if (len > static_cast<int32_t>(prompt.size())) {
        prompt.resize(static_cast<size_t>(len));
        len = llama_chat_apply_template(tmpl, messages, 2, true,
                                        prompt.data(), static_cast<int32_t>(prompt.size()));
    }
    if (len < 0) {
        debugLog("LLM chat template not supported, using a plain prompt");
        return std::string(kSystemPrompt) + "\n\n" + user + "\n\nCleaned text:\n";
    }
    prompt.resize(static_cast<size_t>(len));
    return prompt;
}

std::vector<llama_token> LlamaRefiner::tokenize(const std::string& text) const {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    const auto textLen = static_cast<int32_t>(text.size());
    // A null buffer makes llama_tokenize report the count, negated.
    const int32_t count = -llama_tokenize(vocab, text.c_str(), textLen, nullptr, 0, true, true);
    if (count <= 0) {
        throw std::runtime_error("LLM tokenizer produced no tokens");
    }
    std::vector<llama_token> tokens(static_cast<size_t>(count));
    if (llama_tokenize(vocab, text.c_str(), textLen, tokens.data(), count, true, true) < 0) {
        throw std::runtime_error("LLM tokenizer failed");
    }
    return tokens;
}

std::string LlamaRefiner::tokenToPiece(llama_token token) const {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256];
    const int32_t n = llama_token_to_piece(vocab, token, buf, sizeof(buf), 0, false);
    if (n >= 0) return std::string(buf, static_cast<size_t>(n));

    std::string piece(static_cast<size_t>(-n), '\0');
    if (llama_token_to_piece(vocab, token, piece.data(), -n, 0, false) < 0) {
        throw std::runtime_error("LLM detokenizer failed");
    }
    return piece;
}

std::string LlamaRefiner::refine(const std::string& transcript,
                                 const std::optional<std::string>& context) {
    if (!ctx_) {
        throw std::runtime_error("LLM model not initialized");
    }

    // Every call starts from an empty KV cache.
    llama_memory_clear(llama_get_memory(ctx_.get()), true);
    llama_sampler_reset(sampler_.get());

    std::vector<llama_token> tokens = tokenize(buildPrompt(transcript, context));
    const int nCtx = static_cast<int>(llama_n_ctx(ctx_.get()));
    const int promptTokens = static_cast<int>(tokens.size());
    const int budget = std::min(config_.maxOutputTokens, nCtx - promptTokens - 4);
    if (budget <= 0) {
        throw std::runtime_error("Transcript too long for the LLM context (" +
                                 std::to_string(promptTokens) + " tokens)");
    }

    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    llama_batch batch = llama_batch_get_one(tokens.data(), promptTokens);
    llama_token next = 0;
    std::string output;
    int generated = 0;
    for (; generated < budget; ++generated) {
        if (llama_decode(ctx_.get(), batch) != 0) {
            throw std::runtime_error("llama_decode failed");
        }
        next = llama_sampler_sample(sampler_.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, next)) break;
        output += tokenToPiece(next);
        batch = llama_batch_get_one(&next, 1);
    }

    debugLog("LLM: " + std::to_string(promptTokens) + " prompt tokens, " +
             std::to_string(generated) + " generated");
    return trimmed(stripThinking(output));
}

} // namespace voiceflow
