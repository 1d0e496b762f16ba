#include "core/models/model_session.h"
#include "core/shared/logging.h"

#include <QFile>

#include <algorithm>

#include <onnxruntime_cxx_api.h>

namespace rw {

namespace {

Ort::Env& ortEnvironment()
{
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "ragwatch-models");
    return env;
}

} // namespace

class ModelSession::Impl {
public:
    Ort::SessionOptions sessionOptions;
    std::unique_ptr<Ort::Session> session;
};

ModelSession::ModelSession(QString name, QStringList requiredInputs)
    : m_impl(std::make_unique<Impl>())
    , m_name(std::move(name))
    , m_requiredInputs(std::move(requiredInputs))
{
}

ModelSession::~ModelSession() = default;

bool ModelSession::initialize(const QString& modelPath, int intraOpThreads)
{
    m_available = false;
    if (modelPath.isEmpty() || !QFile::exists(modelPath)) {
        LOG_WARN(rwModels, "ModelSession '%s': model file missing at %s",
                 qUtf8Printable(m_name), qUtf8Printable(modelPath));
        return false;
    }

    try {
        m_impl->sessionOptions.SetIntraOpNumThreads(std::max(1, intraOpThreads));
        m_impl->sessionOptions.SetInterOpNumThreads(1);
        m_impl->sessionOptions.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        m_impl->sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        m_impl->session = std::make_unique<Ort::Session>(
            ortEnvironment(), modelPath.toUtf8().constData(), m_impl->sessionOptions);

        Ort::AllocatorWithDefaultOptions allocator;
        m_inputNames.clear();
        const size_t inputCount = m_impl->session->GetInputCount();
        for (size_t i = 0; i < inputCount; ++i) {
            Ort::AllocatedStringPtr inputName = m_impl->session->GetInputNameAllocated(i, allocator);
            if (inputName.get() != nullptr) {
                m_inputNames.emplace_back(inputName.get());
            }
        }

        for (const QString& required : m_requiredInputs) {
            if (!hasInput(required.toStdString())) {
                LOG_WARN(rwModels, "ModelSession '%s': required input '%s' not in model",
                         qUtf8Printable(m_name), qUtf8Printable(required));
                m_impl->session.reset();
                return false;
            }
        }

        m_outputNames.clear();
        const size_t outputCount = m_impl->session->GetOutputCount();
        for (size_t i = 0; i < outputCount; ++i) {
            Ort::AllocatedStringPtr outputName =
                m_impl->session->GetOutputNameAllocated(i, allocator);
            if (outputName.get() != nullptr && outputName.get()[0] != '\0') {
                m_outputNames.emplace_back(outputName.get());
            }
        }
        if (m_outputNames.empty()) {
            LOG_WARN(rwModels, "ModelSession '%s': model has no outputs", qUtf8Printable(m_name));
            m_impl->session.reset();
            return false;
        }

        LOG_INFO(rwModels, "ModelSession '%s': loaded %s (%zu inputs, %zu outputs)",
                 qUtf8Printable(m_name), qUtf8Printable(modelPath), m_inputNames.size(),
                 m_outputNames.size());
        m_available = true;
        return true;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(rwModels, "ModelSession '%s': ONNX initialization failed: %s",
                 qUtf8Printable(m_name), ex.what());
    }

    m_impl->session.reset();
    return false;
}

bool ModelSession::hasInput(const std::string& inputName) const
{
    return std::find(m_inputNames.begin(), m_inputNames.end(), inputName) != m_inputNames.end();
}

Ort::Session* ModelSession::session() const
{
    return m_impl->session.get();
}

} // namespace rw
