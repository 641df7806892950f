#include "SteadyClock.hpp"

std::shared_ptr<SteadyClock> SteadyClock::instance = nullptr;
std::once_flag SteadyClock::init_flag;

std::shared_ptr<SteadyClock> SteadyClock::getInstance() {
    std::call_once(init_flag, []() {
        instance = std::shared_ptr<SteadyClock>(new SteadyClock());
    });
    return instance;
}

TimePoint SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}
