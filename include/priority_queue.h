#pragma once

#include <cstddef>
#include <vector>

#include "campaign_services.h"

struct QueueEntry {
    RegionId regionId = kNoRegion;
    int cost = 0;

    bool valid() const { return regionId != kNoRegion; }
};

// Binary min-heap keyed by QueueEntry::cost. Equal keys come out in no particular order.
class RegionPriorityQueue {
public:
    void insert(const QueueEntry& entry);
    // Returns an invalid entry when the heap is empty.
    QueueEntry extractMin();
    QueueEntry peek() const;

    bool isEmpty() const { return m_heap.empty(); }
    std::size_t size() const { return m_heap.size(); }
    void clear() { m_heap.clear(); }
    void reserve(std::size_t capacity) { m_heap.reserve(capacity); }

private:
    void siftUp(std::size_t i);
    void siftDown(std::size_t i);

    std::vector<QueueEntry> m_heap;
};
