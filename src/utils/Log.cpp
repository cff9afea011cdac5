#include "utils/Log.hpp"
#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>

namespace rotor::log
{

namespace
{

std::filesystem::path resolve_log_path()
{
    if (auto const *explicit_path = std::getenv("ROTOR_LOG_FILE");
        explicit_path != nullptr && *explicit_path != '\0')
    {
        return std::filesystem::path(explicit_path);
    }
    return rotor::utils::data_root() / "rotor.log";
}

} // namespace

void append_log_line_to_file(std::string const &line)
{
    static std::mutex s_mutex;
    static std::ofstream s_ofs;
    static std::optional<std::filesystem::path> s_path;

    std::lock_guard<std::mutex> lk(s_mutex);
    if (!s_path)
    {
        s_path = resolve_log_path();
    }
    if (!s_ofs.is_open())
    {
        s_ofs.open(s_path->string(), std::ios::app | std::ios::out);
    }
    if (s_ofs.is_open())
    {
        s_ofs << line << '\n';
        s_ofs.flush();
    }
}

} // namespace rotor::log
