#pragma once

namespace rotor::runtime
{

// Async-signal-safe: only touches a lock-free atomic flag.
void request_shutdown() noexcept;
bool should_shutdown() noexcept;

} // namespace rotor::runtime
