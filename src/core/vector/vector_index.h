#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace rw {

// VectorIndex - in-memory HNSW index of one collection.
//
// Vectors are expected L2-normalized so that inner-product distance is
// 1 - cosine similarity. Labels are chosen by the caller (the fragment
// rowid in SQLite); adding an existing label replaces its vector.
class VectorIndex {
public:
    struct KnnResult {
        uint64_t label = 0;
        float distance = 0.0f;
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr int kInitialCapacity = 1024;

    explicit VectorIndex(int dimensions);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    bool create(int initialCapacity = kInitialCapacity);

    bool addVector(uint64_t label, const float* embedding);
    // Unknown labels are ignored.
    bool deleteVector(uint64_t label);

    // Nearest first.
    std::vector<KnnResult> search(const float* queryVector, int k);

    int liveElements() const;
    bool isAvailable() const;
    int dimensions() const { return m_dimensions; }

private:
    bool ensureCapacityForOneMore();

    const int m_dimensions;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    std::unordered_set<uint64_t> m_live;
    mutable std::mutex m_mutex;
};

} // namespace rw
