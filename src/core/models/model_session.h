#pragma once

#include <QString>
#include <QStringList>

#include <memory>
#include <string>
#include <vector>

namespace Ort {
struct Session;
} // namespace Ort

namespace rw {

// ModelSession - one ONNX Runtime inference session on the CPU provider.
//
// initialize() loads the model and checks that every required input name
// exists. Ort::Session::Run is thread-safe, so one session serves all
// worker threads.
class ModelSession {
public:
    ModelSession(QString name, QStringList requiredInputs);
    ~ModelSession();

    ModelSession(const ModelSession&) = delete;
    ModelSession& operator=(const ModelSession&) = delete;
    ModelSession(ModelSession&&) = delete;
    ModelSession& operator=(ModelSession&&) = delete;

    bool initialize(const QString& modelPath, int intraOpThreads = 2);
    bool isAvailable() const { return m_available; }

    const QString& name() const { return m_name; }
    const std::vector<std::string>& inputNames() const { return m_inputNames; }
    const std::vector<std::string>& outputNames() const { return m_outputNames; }
    bool hasInput(const std::string& inputName) const;

    Ort::Session* session() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;

    QString m_name;
    QStringList m_requiredInputs;
    std::vector<std::string> m_inputNames;
    std::vector<std::string> m_outputNames;
    bool m_available = false;
};

} // namespace rw
