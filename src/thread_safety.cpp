#include "bourse/thread_safety.hpp"

namespace bourse {

SettlementGate::ExclusiveLock::ExclusiveLock(SettlementGate& gate) : gate_(gate) {
    gate_.mutex_.lock();
    gate_.owner_.store(std::this_thread::get_id(), std::memory_order_release);
    gate_.settlements_.fetch_add(1);
}

SettlementGate::ExclusiveLock::~ExclusiveLock() {
    gate_.owner_.store(std::thread::id{}, std::memory_order_release);
    gate_.mutex_.unlock();
}

} // namespace bourse
