#ifndef STEADYCLOCK_HPP
#define STEADYCLOCK_HPP

#include <memory>
#include <mutex>

#include "../interfaces/IClock.hpp"

// IClock backed by std::chrono::steady_clock.
class SteadyClock : public IClock {
public:
    static std::shared_ptr<SteadyClock> getInstance();
    ~SteadyClock() override = default;

    TimePoint now() const override;

private:
    SteadyClock() = default;

    static std::shared_ptr<SteadyClock> instance;
    static std::once_flag init_flag;
};

#endif // STEADYCLOCK_HPP
