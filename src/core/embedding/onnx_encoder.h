#pragma once

#include "core/embedding/tokenizer.h"
#include "core/models/embedder_spec.h"

#include <QString>

#include <cstdint>
#include <memory>
#include <vector>

namespace gt {

// First output of the graph: [rows, dims] when the model pools itself,
// [rows, seq, dims] for raw token states.
struct HiddenStates {
    std::vector<int64_t> shape;
    std::vector<float> values;
};

// One CPU inference session over an encoder graph. Not thread-safe; the
// embedding provider serializes calls.
class OnnxEncoder {
public:
    // Fails when the build has no ONNX Runtime, the file cannot be loaded
    // or the graph lacks an input the manifest requires.
    static std::unique_ptr<OnnxEncoder> open(const QString& modelPath, const EmbedderSpec& spec,
                                             QString* errorOut = nullptr);
    ~OnnxEncoder();

    OnnxEncoder(const OnnxEncoder&) = delete;
    OnnxEncoder& operator=(const OnnxEncoder&) = delete;

    bool run(const TokenBatch& batch, HiddenStates* out, QString* errorOut = nullptr);

private:
    OnnxEncoder();

    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace gt
