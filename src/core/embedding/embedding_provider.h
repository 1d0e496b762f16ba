#pragma once

#include <QString>

#include <vector>

namespace rw {

// EmbeddingProvider - turns text into fixed-size vectors.
//
// Passages and queries are framed differently by the model, so the two
// calls are kept apart. A failed call returns an empty result; callers
// treat that as a transient provider error.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual int dimensions() const = 0;

    // One vector per input text, in order, or empty on failure.
    virtual std::vector<std::vector<float>> embedPassages(const std::vector<QString>& texts) = 0;

    // Empty on failure.
    virtual std::vector<float> embedQuery(const QString& text) = 0;
};

} // namespace rw
