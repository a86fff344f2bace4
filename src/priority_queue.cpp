#include "priority_queue.h"

#include <utility>

void RegionPriorityQueue::insert(const QueueEntry& entry) {
    m_heap.push_back(entry);
    siftUp(m_heap.size() - 1);
}

QueueEntry RegionPriorityQueue::extractMin() {
    if (m_heap.empty()) {
        return QueueEntry{};
    }
    const QueueEntry top = m_heap.front();
    m_heap.front() = m_heap.back();
    m_heap.pop_back();
    if (!m_heap.empty()) {
        siftDown(0);
    }
    return top;
}

QueueEntry RegionPriorityQueue::peek() const {
    if (m_heap.empty()) {
        return QueueEntry{};
    }
    return m_heap.front();
}

void RegionPriorityQueue::siftUp(std::size_t i) {
    while (i > 0) {
        const std::size_t p = (i - 1) / 2;
        if (m_heap[i].cost >= m_heap[p].cost) {
            break;
        }
        std::swap(m_heap[i], m_heap[p]);
        i = p;
    }
}

void RegionPriorityQueue::siftDown(std::size_t i) {
    const std::size_t n = m_heap.size();
    for (;;) {
        const std::size_t l = 2 * i + 1;
        const std::size_t r = l + 1;
        std::size_t s = i;
        if (l < n && m_heap[l].cost < m_heap[s].cost) s = l;
        if (r < n && m_heap[r].cost < m_heap[s].cost) s = r;
        if (s == i) break;
        std::swap(m_heap[i], m_heap[s]);
        i = s;
    }
}
