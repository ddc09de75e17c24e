#include "core/embedding/onnx_encoder.h"

#include "core/shared/logging.h"

#include <QFileInfo>

#include <algorithm>
#include <string>

#ifdef GOTO_WITH_ONNX
#include <onnxruntime_cxx_api.h>
#endif

namespace gt {

#ifdef GOTO_WITH_ONNX

namespace {

Ort::Env& environment()
{
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "goto");
    return env;
}

std::vector<std::string> nodeNames(Ort::Session& session, bool inputs)
{
    Ort::AllocatorWithDefaultOptions allocator;
    const size_t count = inputs ? session.GetInputCount() : session.GetOutputCount();
    std::vector<std::string> names;
    for (size_t i = 0; i < count; ++i) {
        const Ort::AllocatedStringPtr name = inputs ? session.GetInputNameAllocated(i, allocator)
                                                    : session.GetOutputNameAllocated(i, allocator);
        if (name && name.get()[0] != '\0') {
            names.emplace_back(name.get());
        }
    }
    return names;
}

} // namespace

struct OnnxEncoder::Impl {
    std::unique_ptr<Ort::Session> session;
    std::string output;
    bool wantsTokenTypes = false;
};

#else

struct OnnxEncoder::Impl {
};

#endif

OnnxEncoder::OnnxEncoder()
    : m_impl(std::make_unique<Impl>())
{
}

OnnxEncoder::~OnnxEncoder() = default;

std::unique_ptr<OnnxEncoder> OnnxEncoder::open(const QString& modelPath, const EmbedderSpec& spec,
                                               QString* errorOut)
{
#ifdef GOTO_WITH_ONNX
    if (!QFileInfo(modelPath).isFile()) {
        if (errorOut) {
            *errorOut = QStringLiteral("model file %1 not found").arg(modelPath);
        }
        return nullptr;
    }

    std::unique_ptr<OnnxEncoder> encoder(new OnnxEncoder());
    try {
        Ort::SessionOptions options;
        options.SetIntraOpNumThreads(2);
        options.SetInterOpNumThreads(1);
        options.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
        encoder->m_impl->session = std::make_unique<Ort::Session>(
            environment(), modelPath.toUtf8().constData(), options);
    } catch (const Ort::Exception& ex) {
        if (errorOut) {
            *errorOut = QStringLiteral("cannot load %1: %2").arg(modelPath, QString::fromUtf8(ex.what()));
        }
        return nullptr;
    }

    const std::vector<std::string> inputs = nodeNames(*encoder->m_impl->session, true);
    const auto hasInput = [&inputs](const std::string& name) {
        return std::find(inputs.begin(), inputs.end(), name) != inputs.end();
    };
    for (const QString& required : spec.requiredInputs) {
        if (!hasInput(required.toStdString())) {
            if (errorOut) {
                *errorOut = QStringLiteral("model has no input '%1'").arg(required);
            }
            return nullptr;
        }
    }

    const std::vector<std::string> outputs = nodeNames(*encoder->m_impl->session, false);
    if (outputs.empty()) {
        if (errorOut) {
            *errorOut = QStringLiteral("model has no outputs");
        }
        return nullptr;
    }
    encoder->m_impl->output = outputs.front();
    encoder->m_impl->wantsTokenTypes = hasInput("token_type_ids");

    LOG_DEBUG(gotoEmbedding, "Opened %s (output %s, token types %s)", qPrintable(modelPath),
              encoder->m_impl->output.c_str(), encoder->m_impl->wantsTokenTypes ? "yes" : "no");
    return encoder;
#else
    Q_UNUSED(modelPath);
    Q_UNUSED(spec);
    if (errorOut) {
        *errorOut = QStringLiteral("built without ONNX Runtime");
    }
    return nullptr;
#endif
}

bool OnnxEncoder::run(const TokenBatch& batch, HiddenStates* out, QString* errorOut)
{
#ifdef GOTO_WITH_ONNX
    if (batch.empty() || !out) {
        if (errorOut) {
            *errorOut = QStringLiteral("empty batch");
        }
        return false;
    }

    const int64_t shape[2] = {batch.rows, batch.columns};
    const auto tensor = [&shape](const Ort::MemoryInfo& memory, const std::vector<int64_t>& data) {
        return Ort::Value::CreateTensor<int64_t>(memory, const_cast<int64_t*>(data.data()),
                                                 data.size(), shape, 2);
    };

    try {
        const Ort::MemoryInfo memory = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        std::vector<const char*> names{"input_ids", "attention_mask"};
        std::vector<Ort::Value> inputs;
        inputs.push_back(tensor(memory, batch.ids));
        inputs.push_back(tensor(memory, batch.mask));
        if (m_impl->wantsTokenTypes) {
            names.push_back("token_type_ids");
            inputs.push_back(tensor(memory, batch.typeIds));
        }

        const char* output = m_impl->output.c_str();
        std::vector<Ort::Value> results = m_impl->session->Run(
            Ort::RunOptions{nullptr}, names.data(), inputs.data(), inputs.size(), &output, 1);
        if (results.empty() || !results.front().IsTensor()) {
            if (errorOut) {
                *errorOut = QStringLiteral("model returned no tensor");
            }
            return false;
        }

        const Ort::TensorTypeAndShapeInfo info = results.front().GetTensorTypeAndShapeInfo();
        const float* data = results.front().GetTensorData<float>();
        out->shape = info.GetShape();
        out->values.assign(data, data + info.GetElementCount());
        return true;
    } catch (const Ort::Exception& ex) {
        if (errorOut) {
            *errorOut = QString::fromUtf8(ex.what());
        }
        return false;
    }
#else
    Q_UNUSED(batch);
    Q_UNUSED(out);
    if (errorOut) {
        *errorOut = QStringLiteral("built without ONNX Runtime");
    }
    return false;
#endif
}

} // namespace gt
