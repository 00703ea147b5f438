#pragma once

#include <cstddef>
#include <cstdint>
#include <queue>
#include <utility>
#include <vector>

// Navigation PriorityQueue subsystem
// Responsible for: the min-priority open set used by path search.
// Should NOT do: decrease-key or deduplication; callers skip stale entries themselves.
namespace delve::nav {

template <typename Item>
class MinPriorityQueue {
public:
    void put(Item item, double priority) {
        m_heap.push(Entry{priority, m_nextSequence++, std::move(item)});
    }

    // Lowest priority first; equal priorities pop in insertion order.
    // Must not be called on an empty queue.
    Item pop() {
        Item item = m_heap.top().item;
        m_heap.pop();
        return item;
    }

    double topPriority() const {
        return m_heap.top().priority;
    }

    bool empty() const {
        return m_heap.empty();
    }

    std::size_t size() const {
        return m_heap.size();
    }

private:
    struct Entry {
        double priority = 0.0;
        std::uint64_t sequence = 0;
        Item item;
    };

    struct Later {
        bool operator()(const Entry& lhs, const Entry& rhs) const {
            if (lhs.priority != rhs.priority) {
                return lhs.priority > rhs.priority;
            }
            return lhs.sequence > rhs.sequence;
        }
    };

    std::priority_queue<Entry, std::vector<Entry>, Later> m_heap;
    std::uint64_t m_nextSequence = 0;
};

} // namespace delve::nav
