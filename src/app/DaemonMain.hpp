#pragma once

namespace rotor::app
{

// Runs the rotord daemon: loads the pool, drives rotation until SIGINT or
// SIGTERM and logs pool status snapshots as JSON.
int daemon_main(int argc, char *argv[]);

} // namespace rotor::app
