#pragma once

#include <filesystem>
#include <optional>

namespace rotor::utils
{

// Directory holding the pool database and log file. ROTOR_DATA_DIR wins,
// then the per-user data directory, then <executable dir>/data.
std::filesystem::path data_root();
std::optional<std::filesystem::path> executable_path();
std::optional<std::filesystem::path> user_data_root();

} // namespace rotor::utils
