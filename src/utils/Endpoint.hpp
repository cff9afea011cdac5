#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>

namespace rotor::net
{

struct HostPort
{
    std::string host;
    std::string port;
};

inline std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return value;
}

// "host:port", "[v6]:port" or a bare host. Brackets are stripped.
inline HostPort parse_host_port(std::string_view input)
{
    HostPort result;
    if (input.empty())
    {
        return result;
    }
    if (input.front() == '[')
    {
        auto closing = input.find(']');
        if (closing == std::string_view::npos)
        {
            result.host = std::string(input);
            return result;
        }
        result.host = std::string(input.substr(1, closing - 1));
        if (closing + 1 < input.size() && input[closing + 1] == ':')
        {
            result.port = std::string(input.substr(closing + 2));
        }
        return result;
    }
    auto colon = input.find(':');
    if (colon == std::string_view::npos || input.find(':', colon + 1) !=
                                               std::string_view::npos)
    {
        // bare IPv6 literal without a port
        result.host = std::string(input);
        return result;
    }
    result.host = std::string(input.substr(0, colon));
    result.port = std::string(input.substr(colon + 1));
    return result;
}

constexpr std::array<std::string_view, 3> kLoopbackHosts = {
    "127.0.0.1", "localhost", "::1"};

inline bool is_loopback_host(std::string_view host)
{
    auto normalized = to_lower(parse_host_port(host).host);
    if (normalized == "0:0:0:0:0:0:0:1")
    {
        return true;
    }
    return std::find(kLoopbackHosts.begin(), kLoopbackHosts.end(),
                     normalized) != kLoopbackHosts.end();
}

// Host and port of a listener URL such as "http://127.0.0.1:8765".
inline HostPort parse_bind_url(std::string_view url)
{
    auto scheme = url.find("://");
    if (scheme != std::string_view::npos)
    {
        url.remove_prefix(scheme + 3);
    }
    auto slash = url.find('/');
    if (slash != std::string_view::npos)
    {
        url = url.substr(0, slash);
    }
    return parse_host_port(url);
}

} // namespace rotor::net
