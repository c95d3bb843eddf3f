#pragma once

#include <optional>
#include <string>

namespace voiceflow {

// A language model that rewrites a raw transcript into clean prose.
class TextRefiner {
public:
    virtual ~TextRefiner() = default;

    // True when the model file is on disk. Cheap, nothing is loaded.
    virtual bool available() const = 0;

    // Loads the model. Returns false (and logs why) if it cannot be loaded.
    virtual bool init() = 0;
    virtual void release() = 0;
    virtual bool isReady() const = 0;

    // `context` is the text preceding the dictation, if the host knows it.
    // Throws std::runtime_error if the model is not ready or generation fails.
    virtual std::string refine(const std::string& transcript,
                               const std::optional<std::string>& context) = 0;

    virtual const std::string& modelPath() const = 0;
};

} // namespace voiceflow
