#pragma once

namespace tmax::runtime
{

// Installs SIGINT/SIGTERM handlers that only raise the shutdown flag.
void install_signal_handlers() noexcept;

void request_shutdown() noexcept;
bool should_shutdown() noexcept;

} // namespace tmax::runtime
