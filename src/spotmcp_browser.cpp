#include "spotmcp_browser.hpp"
#include "spotmcp_tracing.hpp"
#include <cstdlib>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#elif defined(__APPLE__)
#include <CoreFoundation/CoreFoundation.h>
#include <ApplicationServices/ApplicationServices.h>
#else
#include <unistd.h>
#include <sys/wait.h>
#endif

namespace spotmcp {

void SpotmcpBrowser::OpenUrl(const std::string& url) {
    SPOTMCP_TRACE_DEBUG("BROWSER", "Opening URL with " + GetDefaultBrowser());
#ifdef _WIN32
    OpenUrlWindows(url);
#elif defined(__APPLE__)
    OpenUrlMacOS(url);
#else
    OpenUrlLinux(url);
#endif
}

std::string SpotmcpBrowser::GetDefaultBrowser() {
#ifdef _WIN32
    return "default";
#elif defined(__APPLE__)
    return "open";
#else
    return "xdg-open";
#endif
}

void SpotmcpBrowser::OpenUrlWindows(const std::string& url) {
#ifdef _WIN32
    HINSTANCE result = ShellExecuteA(NULL, "open", url.c_str(), NULL, NULL, SW_SHOWNORMAL);
    if (result <= (HINSTANCE)32) {
        throw std::runtime_error("Failed to open browser on Windows");
    }
#else
    throw std::runtime_error("Windows-specific browser opening not available on this platform");
#endif
}

void SpotmcpBrowser::OpenUrlMacOS(const std::string& url) {
#ifdef __APPLE__
    CFStringRef urlString = CFStringCreateWithCString(NULL, url.c_str(), kCFStringEncodingUTF8);
    if (!urlString) {
        throw std::runtime_error("Failed to convert URL for the macOS launcher");
    }
    CFURLRef urlRef = CFURLCreateWithString(NULL, urlString, NULL);
    CFRelease(urlString);
    if (!urlRef) {
        throw std::runtime_error("Invalid URL for the macOS launcher");
    }

    OSStatus status = LSOpenCFURLRef(urlRef, NULL);
    CFRelease(urlRef);
    if (status != noErr) {
        throw std::runtime_error("LSOpenCFURLRef failed with status " + std::to_string(status));
    }
#else
    throw std::runtime_error("macOS-specific browser opening not available on this platform");
#endif
}

void SpotmcpBrowser::OpenUrlLinux(const std::string& url) {
#if !defined(_WIN32) && !defined(__APPLE__)
    // Double fork so xdg-open is reparented and never left as a zombie of this process
    pid_t pid = fork();
    if (pid == 0) {
        pid_t grandchild = fork();
        if (grandchild == 0) {
            execlp("xdg-open", "xdg-open", url.c_str(), static_cast<char*>(nullptr));
            _exit(127);
        }
        _exit(grandchild > 0 ? 0 : 1);
    } else if (pid > 0) {
        int status = 0;
        if (waitpid(pid, &status, 0) < 0 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            throw std::runtime_error("Failed to start xdg-open");
        }
    } else {
        throw std::runtime_error("Failed to fork process for opening browser");
    }
#else
    throw std::runtime_error("Linux-specific browser opening not available on this platform");
#endif
}

} // namespace spotmcp
