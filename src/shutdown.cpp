#include "shutdown.hpp"

namespace relay_guard {

bool ShutdownCoordinator::request(const std::string& reason) {
    std::vector<Observer> to_run;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (requested_.exchange(true, std::memory_order_acq_rel)) return false;
        reason_ = reason;
        to_run.swap(observers_);
    }
    for (auto& observer : to_run) {
        observer(reason);
    }
    return true;
}

void ShutdownCoordinator::on_shutdown(Observer observer) {
    std::string reason;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!requested_.load(std::memory_order_acquire)) {
            observers_.push_back(std::move(observer));
            return;
        }
        reason = reason_;
    }
    observer(reason);
}

} // namespace relay_guard
