#pragma once

namespace rt::runtime
{

void request_shutdown() noexcept;
bool should_shutdown() noexcept;
void install_signal_handlers();

} // namespace rt::runtime
