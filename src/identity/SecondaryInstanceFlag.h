#pragma once

#include <atomic>

namespace twinboot::identity {

// Set once when a sibling detector recognizes this process as a clone.
// Never cleared for the lifetime of the process.
class SecondaryInstanceFlag {
public:
    // Returns true only for the call that actually set the flag.
    bool Set() noexcept { return !m_set.exchange(true, std::memory_order_acq_rel); }
    [[nodiscard]] bool IsSet() const noexcept { return m_set.load(std::memory_order_acquire); }

private:
    std::atomic<bool> m_set{false};
};

} // namespace twinboot::identity
