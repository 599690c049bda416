#pragma once

#include "audit/access_record.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

namespace rlsengine {

/**
 * @brief Bounded lock-free queue between evaluating threads and the access-log writer
 *
 * Every slot carries a sequence number. A producer claims a position with a
 * CAS only when the slot at that position has been released by the writer,
 * so a full queue rejects the record without reserving anything and the
 * writer never waits on a position nobody will publish.
 *
 *   slot.sequence == pos          free for the producer claiming pos
 *   slot.sequence == pos + 1      published, ready for the writer
 *   slot.sequence == pos + cap    released, free for the next lap
 */
class AccessRecordQueue {
public:
    static constexpr size_t kDefaultCapacity = 16384;

    /// Rounded up to a power of two, at least 2
    explicit AccessRecordQueue(size_t capacity = kDefaultCapacity);

    AccessRecordQueue(const AccessRecordQueue&) = delete;
    AccessRecordQueue& operator=(const AccessRecordQueue&) = delete;

    /// Any thread. False when the queue is full; the record is left untouched.
    [[nodiscard]] bool try_push(AccessRecord& record);

    /// Writer thread only. Appends up to max_count records in claim order.
    size_t drain(std::vector<AccessRecord>& batch, size_t max_count);

    [[nodiscard]] size_t capacity() const noexcept { return mask_ + 1; }

private:
    struct alignas(64) Slot {
        std::atomic<size_t> sequence{0};
        AccessRecord record;
    };

    size_t mask_;
    std::unique_ptr<Slot[]> slots_;

    alignas(64) std::atomic<size_t> enqueue_pos_{0};
    alignas(64) size_t dequeue_pos_ = 0;  // Writer thread only
};

} // namespace rlsengine
