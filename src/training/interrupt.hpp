#ifndef ARBOR_TRAINING_INTERRUPT_HPP
#define ARBOR_TRAINING_INTERRUPT_HPP

#include <csignal>

#include "../common/errors.hpp"

namespace Arbor::Training {
    namespace Details {
        inline volatile std::sig_atomic_t interrupt_requested = 0;

        inline void on_interrupt(int) { interrupt_requested = 1; }
    }

    // Routes SIGINT into a flag for the lifetime of the guard. The flag is
    // turned into InterruptedRun at the points that call poll().
    class InterruptGuard {
    public:
        InterruptGuard()
        {
            Details::interrupt_requested = 0;
            previous_ = std::signal(SIGINT, Details::on_interrupt);
        }

        ~InterruptGuard()
        {
            if (previous_ != SIG_ERR) {
                std::signal(SIGINT, previous_);
            }
            Details::interrupt_requested = 0;
        }

        InterruptGuard(const InterruptGuard&) = delete;
        InterruptGuard& operator=(const InterruptGuard&) = delete;

        [[nodiscard]] static bool requested() noexcept { return Details::interrupt_requested != 0; }

        static void poll()
        {
            if (Details::interrupt_requested != 0) {
                Details::interrupt_requested = 0;
                throw InterruptedRun();
            }
        }

    private:
        using Handler = void (*)(int);
        Handler previous_{SIG_ERR};
    };
}

#endif // ARBOR_TRAINING_INTERRUPT_HPP
