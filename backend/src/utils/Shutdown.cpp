#include "utils/Shutdown.hpp"

#include <atomic>
#include <csignal>

namespace rt::runtime
{

namespace
{
std::atomic_bool g_shutdown_requested{false};

extern "C" void handle_signal(int)
{
    g_shutdown_requested.store(true, std::memory_order_relaxed);
}
} // namespace

void request_shutdown() noexcept
{
    g_shutdown_requested.store(true, std::memory_order_relaxed);
}

bool should_shutdown() noexcept
{
    return g_shutdown_requested.load(std::memory_order_relaxed);
}

void install_signal_handlers()
{
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

} // namespace rt::runtime
