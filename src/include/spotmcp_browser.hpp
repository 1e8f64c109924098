#pragma once

#include <string>

namespace spotmcp {

// Hands a URL to the desktop's default browser. Throws std::runtime_error
// when no launcher could be started.
class SpotmcpBrowser {
public:
    static void OpenUrl(const std::string& url);

    // Name of the launcher used on this platform
    static std::string GetDefaultBrowser();

private:
    static void OpenUrlWindows(const std::string& url);
    static void OpenUrlMacOS(const std::string& url);
    static void OpenUrlLinux(const std::string& url);
};

} // namespace spotmcp
