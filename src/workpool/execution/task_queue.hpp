/**
 * @file task_queue.hpp
 * @brief Priority-ordered FIFO holding area for tasks awaiting a worker.
 */
#pragma once
#include "workpool/common/common.hpp"
#include "workpool/execution/task.hpp"

namespace workpool
{

/**
 * @brief Priority queue with FIFO order among equal priorities.
 *
 * @details
 * Strictly higher priorities are dequeued first. Entries with equal priority
 * are dequeued in insertion order. The priority of an entry is obtained via
 * an unqualified call to `priority_of(entry)`, so any entry type may be queued
 * by providing that function in its namespace.
 *
 * @par Thread Safety
 * - Not thread-safe. WorkerPool confines its queue to the dispatcher thread.
 * - The queue does not prevent double consumption; single-consumer discipline
 *   is the caller's responsibility.
 *
 * @tparam Entry The queued type (defaults to Task).
 */
template <typename Entry = Task>
class TaskQueue
{
public:
    /**
     * @brief Insert an entry behind all entries of equal or higher priority.
     */
    void enqueue(Entry entry)
    {
        const int priority = priority_of(entry);
        m_entries.emplace(Key{priority, m_next_sequence++}, std::move(entry));
    }

    /**
     * @brief Remove and return the highest-priority entry.
     * @return The entry, or std::nullopt if the queue is empty.
     */
    std::optional<Entry> dequeue()
    {
        if (m_entries.empty())
        {
            return std::nullopt;
        }
        auto it = m_entries.begin();
        std::optional<Entry> entry{std::move(it->second)};
        m_entries.erase(it);
        return entry;
    }

    /**
     * @brief Remove all entries, oldest highest-priority first.
     * @return The removed entries in dequeue order.
     */
    std::vector<Entry> drain()
    {
        std::vector<Entry> entries;
        entries.reserve(m_entries.size());
        for (auto& kv : m_entries)
        {
            entries.push_back(std::move(kv.second));
        }
        m_entries.clear();
        return entries;
    }

    size_t size() const noexcept
    {
        return m_entries.size();
    }

    bool empty() const noexcept
    {
        return m_entries.empty();
    }

    void clear()
    {
        m_entries.clear();
    }

private:
    struct Key
    {
        int priority;
        std::uint64_t sequence;
    };

    struct KeyOrder
    {
        bool operator()(const Key& lhs, const Key& rhs) const noexcept
        {
            if (lhs.priority != rhs.priority)
            {
                return lhs.priority > rhs.priority;
            }
            return lhs.sequence < rhs.sequence;
        }
    };

    std::map<Key, Entry, KeyOrder> m_entries;
    std::uint64_t m_next_sequence{0};
};

} // namespace workpool
