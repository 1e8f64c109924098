#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <cstdint>

namespace spotmcp {

enum class TraceLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG_LEVEL = 4,
    TRACE = 5
};

// Parse "ERROR", "warn", "Debug", ... Unknown names map to INFO.
TraceLevel StringToTraceLevel(const std::string& level_str);

class SpotmcpTracer {
public:
    static SpotmcpTracer& Instance();

    void SetEnabled(bool enabled);
    void SetLevel(TraceLevel level);
    void SetTraceDirectory(const std::string& directory);
    void SetOutputMode(const std::string& output_mode);
    void SetMaxFileSize(int64_t max_size);
    void SetRotation(bool rotation);

    bool IsEnabled() const { return enabled; }
    TraceLevel GetLevel() const { return level; }
    std::string GetOutputMode() const { return output_mode; }
    std::string GetTraceDirectory() const { return trace_directory; }
    int64_t GetMaxFileSize() const { return max_file_size; }
    bool GetRotation() const { return rotation_enabled; }

    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message);
    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data);

    void Error(const std::string& component, const std::string& message);
    void Error(const std::string& component, const std::string& message, const std::string& data);
    void Warn(const std::string& component, const std::string& message);
    void Warn(const std::string& component, const std::string& message, const std::string& data);
    void Info(const std::string& component, const std::string& message);
    void Info(const std::string& component, const std::string& message, const std::string& data);
    void Debug(const std::string& component, const std::string& message);
    void Debug(const std::string& component, const std::string& message, const std::string& data);
    void Trace(const std::string& component, const std::string& message);
    void Trace(const std::string& component, const std::string& message, const std::string& data);

    // Shortens a secret for log output: first 10 characters followed by "...".
    static std::string Redact(const std::string& secret);

private:
    SpotmcpTracer() = default;
    ~SpotmcpTracer() = default;
    SpotmcpTracer(const SpotmcpTracer&) = delete;
    SpotmcpTracer& operator=(const SpotmcpTracer&) = delete;

    void Emit(const std::string& log_message);
    void OpenTraceFile();
    void RotateIfNeeded();
    std::string TraceFilePath() const;
    std::string GetTimestamp();
    std::string LevelToString(TraceLevel level);

    bool enabled = false;
    TraceLevel level = TraceLevel::INFO;
    std::string trace_directory = ".";
    std::string output_mode = "console";
    int64_t max_file_size = 10485760; // 10MB default
    bool rotation_enabled = true;
    std::unique_ptr<std::ofstream> trace_file;
    std::mutex trace_mutex;
};

#define SPOTMCP_TRACE_ERROR(component, message) \
    ::spotmcp::SpotmcpTracer::Instance().Error(component, message)

#define SPOTMCP_TRACE_ERROR_DATA(component, message, data) \
    ::spotmcp::SpotmcpTracer::Instance().Error(component, message, data)

#define SPOTMCP_TRACE_WARN(component, message) \
    ::spotmcp::SpotmcpTracer::Instance().Warn(component, message)

#define SPOTMCP_TRACE_WARN_DATA(component, message, data) \
    ::spotmcp::SpotmcpTracer::Instance().Warn(component, message, data)

#define SPOTMCP_TRACE_INFO(component, message) \
    ::spotmcp::SpotmcpTracer::Instance().Info(component, message)

#define SPOTMCP_TRACE_INFO_DATA(component, message, data) \
    ::spotmcp::SpotmcpTracer::Instance().Info(component, message, data)

#define SPOTMCP_TRACE_DEBUG(component, message) \
    ::spotmcp::SpotmcpTracer::Instance().Debug(component, message)

#define SPOTMCP_TRACE_DEBUG_DATA(component, message, data) \
    ::spotmcp::SpotmcpTracer::Instance().Debug(component, message, data)

#define SPOTMCP_TRACE_TRACE(component, message) \
    ::spotmcp::SpotmcpTracer::Instance().Trace(component, message)

#define SPOTMCP_TRACE_TRACE_DATA(component, message, data) \
    ::spotmcp::SpotmcpTracer::Instance().Trace(component, message, data)

} // namespace spotmcp
