#include "audit/access_record_queue.hpp"

#include <algorithm>
#include <bit>

namespace rlsengine {

AccessRecordQueue::AccessRecordQueue(size_t capacity)
    : mask_(std::bit_ceil(std::max(capacity, size_t{2})) - 1),
      slots_(std::make_unique<Slot[]>(mask_ + 1)) {
    for (size_t i = 0; i <= mask_; ++i) {
        slots_[i].sequence.store(i, std::memory_order_relaxed);
    }
}

bool AccessRecordQueue::try_push(AccessRecord& record) {
    size_t pos = enqueue_pos_.load(std::memory_order_relaxed);
    Slot* slot = nullptr;

    for (;;) {
        slot = &slots_[pos & mask_];
        const size_t seq = slot->sequence.load(std::memory_order_acquire);
        const auto diff = static_cast<std::ptrdiff_t>(seq) - static_cast<std::ptrdiff_t>(pos);

        if (diff == 0) {
            // On failure pos is reloaded with the winner's position
            if (enqueue_pos_.compare_exchange_weak(pos, pos + 1,
                                                   std::memory_order_relaxed,
                                                   std::memory_order_relaxed)) {
                break;
            }
        } else if (diff < 0) {
            return false;  // Writer has not released this slot yet
        } else {
            pos = enqueue_pos_.load(std::memory_order_relaxed);
        }
    }

    slot->record = std::move(record);
    slot->sequence.store(pos + 1, std::memory_order_release);
    return true;
}

size_t AccessRecordQueue::drain(std::vector<AccessRecord>& batch, size_t max_count) {
    size_t count = 0;

    while (count < max_count) {
        Slot& slot = slots_[dequeue_pos_ & mask_];
        if (slot.sequence.load(std::memory_order_acquire) != dequeue_pos_ + 1) {
            break;
        }

        batch.push_back(std::move(slot.record));
        slot.record = AccessRecord{};
        slot.sequence.store(dequeue_pos_ + mask_ + 1, std::memory_order_release);

        ++dequeue_pos_;
        ++count;
    }

    return count;
}

} // namespace rlsengine
