#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <Windows.h>
#include <ShlObj.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#else
#include <unistd.h>
#endif

namespace rotor::utils
{

namespace
{
std::optional<std::filesystem::path> ensure_directory(
    std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::exists(candidate))
    {
        return candidate;
    }
    return std::nullopt;
}

std::filesystem::path fallback_root()
{
    if (auto exe = executable_path(); exe && !exe->filename().empty())
    {
        return exe->parent_path();
    }
    return std::filesystem::current_path();
}
} // namespace

std::optional<std::filesystem::path> executable_path()
{
#if defined(_WIN32)
    std::vector<wchar_t> buffer(32768);
    DWORD length = GetModuleFileNameW(nullptr, buffer.data(),
                                      static_cast<DWORD>(buffer.size()));
    if (length == 0 || length >= buffer.size())
    {
        return std::nullopt;
    }
    return std::filesystem::path(buffer.data(), buffer.data() + length);
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    if (size == 0)
    {
        return std::nullopt;
    }
    std::vector<char> buffer(size);
    if (_NSGetExecutablePath(buffer.data(), &size) != 0)
    {
        return std::nullopt;
    }
    return std::filesystem::path(buffer.data());
#else
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
#endif
}

std::optional<std::filesystem::path> user_data_root()
{
#if defined(_WIN32)
    PWSTR local_app = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, KF_FLAG_CREATE,
                                       nullptr, &local_app)) &&
        local_app)
    {
        std::filesystem::path path(local_app);
        CoTaskMemFree(local_app);
        path /= "Rotor";
        return ensure_directory(path);
    }
#else
    if (auto const *xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
    {
        return ensure_directory(std::filesystem::path(xdg) / "rotor");
    }
    if (auto const *home = std::getenv("HOME"); home && *home)
    {
        return ensure_directory(std::filesystem::path(home) / ".local" /
                                "share" / "rotor");
    }
#endif
    return std::nullopt;
}

std::filesystem::path data_root()
{
    if (auto const *explicit_root = std::getenv("ROTOR_DATA_DIR");
        explicit_root && *explicit_root)
    {
        if (auto ensured = ensure_directory(explicit_root))
        {
            return *ensured;
        }
    }
    if (auto user_root = user_data_root())
    {
        return *user_root;
    }
    auto fallback = fallback_root();
    fallback /= "data";
    if (auto ensured = ensure_directory(fallback))
    {
        return *ensured;
    }
    return fallback;
}

} // namespace rotor::utils
