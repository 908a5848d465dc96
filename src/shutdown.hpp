#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace relay_guard {

// One-shot cooperative stop signal. The flag only ever goes false -> true.
class ShutdownCoordinator {
public:
    using Observer = std::function<void(const std::string& reason)>;

    // Returns true for the call that actually flipped the flag; observers run
    // on that caller's thread, once.
    bool request(const std::string& reason);

    bool requested() const { return requested_.load(std::memory_order_acquire); }

    // Observers registered after the flag is set run immediately.
    void on_shutdown(Observer observer);

private:
    std::atomic<bool> requested_{false};
    std::mutex mu_;
    std::vector<Observer> observers_;
    std::string reason_;
};

} // namespace relay_guard
