#include "core/vector/vector_index.h"
#include "core/shared/logging.h"

#include <hnswlib/hnswlib.h>

#include <algorithm>

namespace rw {

VectorIndex::VectorIndex(int dimensions)
    : m_dimensions(dimensions)
{
}

VectorIndex::~VectorIndex() = default;

bool VectorIndex::create(int initialCapacity)
{
    if (m_dimensions <= 0) {
        LOG_ERROR(rwStore, "VectorIndex::create requires positive dimensions, got %d",
                  m_dimensions);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        const int capacity = std::max(initialCapacity, 1);
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_dimensions);
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            static_cast<size_t>(capacity),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_live.clear();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(rwStore, "VectorIndex::create failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::addVector(uint64_t label, const float* embedding)
{
    if (!m_index || embedding == nullptr) {
        LOG_WARN(rwStore, "VectorIndex::addVector called with unavailable index or null vector");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureCapacityForOneMore()) {
        return false;
    }

    try {
        // Re-adding a known or deleted label updates it in place.
        m_index->addPoint(embedding, static_cast<hnswlib::labeltype>(label));
        m_live.insert(label);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(rwStore, "VectorIndex::addVector failed: %s", e.what());
        return false;
    }
}

bool VectorIndex::deleteVector(uint64_t label)
{
    if (!m_index) {
        LOG_WARN(rwStore, "VectorIndex::deleteVector called with unavailable index");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_live.count(label) == 0) {
        return true;
    }
    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(label));
        m_live.erase(label);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(rwStore, "VectorIndex::deleteVector failed: %s", e.what());
        return false;
    }
}

std::vector<VectorIndex::KnnResult> VectorIndex::search(const float* queryVector, int k)
{
    std::vector<KnnResult> results;
    if (!m_index || queryVector == nullptr || k <= 0) {
        return results;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const int limit = std::min(k, static_cast<int>(m_live.size()));
    if (limit <= 0) {
        return results;
    }
    try {
        m_index->setEf(static_cast<size_t>(std::max(kEfSearch, limit)));
        auto queue = m_index->searchKnn(queryVector, static_cast<size_t>(limit));
        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            results.push_back(KnnResult{static_cast<uint64_t>(entry.second), entry.first});
        }
        std::sort(results.begin(), results.end(), [](const KnnResult& a, const KnnResult& b) {
            return a.distance < b.distance;
        });
        return results;
    } catch (const std::exception& e) {
        LOG_ERROR(rwStore, "VectorIndex::search failed: %s", e.what());
        return {};
    }
}

int VectorIndex::liveElements() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_live.size());
}

bool VectorIndex::isAvailable() const
{
    return m_index != nullptr;
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();
    if (maxElements == 0) {
        LOG_ERROR(rwStore, "VectorIndex has zero max elements");
        return false;
    }

    const size_t threshold = (maxElements * 8) / 10;
    if (current < threshold) {
        return true;
    }

    const size_t newCapacity = maxElements * 2;
    try {
        m_index->resizeIndex(newCapacity);
        LOG_DEBUG(rwStore, "VectorIndex resized to capacity %llu",
                  static_cast<unsigned long long>(newCapacity));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(rwStore, "VectorIndex resize failed: %s", e.what());
        return false;
    }
}

} // namespace rw
