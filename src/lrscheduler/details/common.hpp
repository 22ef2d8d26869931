#ifndef VERITAS_LRSCHEDULER_COMMON_HPP
#define VERITAS_LRSCHEDULER_COMMON_HPP

namespace Veritas::LrScheduler::Details {

    class Scheduler {
    public:
        virtual ~Scheduler() = default;
        virtual void step() = 0;
    };

}  // namespace Veritas::LrScheduler::Details

#endif // VERITAS_LRSCHEDULER_COMMON_HPP
