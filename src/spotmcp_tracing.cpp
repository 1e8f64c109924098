#include "spotmcp_tracing.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace spotmcp {

namespace {
const char* const TRACE_FILE_NAME = "spotmcp_trace.log";
}

TraceLevel StringToTraceLevel(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "NONE") return TraceLevel::NONE;
    if (upper == "ERROR") return TraceLevel::ERROR;
    if (upper == "WARN" || upper == "WARNING") return TraceLevel::WARN;
    if (upper == "INFO") return TraceLevel::INFO;
    if (upper == "DEBUG") return TraceLevel::DEBUG_LEVEL;
    if (upper == "TRACE") return TraceLevel::TRACE;
    return TraceLevel::INFO;
}

SpotmcpTracer& SpotmcpTracer::Instance() {
    static SpotmcpTracer instance;
    return instance;
}

void SpotmcpTracer::SetEnabled(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->enabled = enabled;

        if (!enabled && trace_file) {
            if (trace_file->is_open()) {
                trace_file->close();
            }
            trace_file.reset();
        } else if (enabled && output_mode != "console" && !trace_file) {
            OpenTraceFile();
        }
    }
    Info("TRACER", std::string("Tracing ") + (enabled ? "enabled" : "disabled"));
}

void SpotmcpTracer::SetLevel(TraceLevel level) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->level = level;
    }
    Info("TRACER", "Trace level set to: " + LevelToString(level));
}

void SpotmcpTracer::SetTraceDirectory(const std::string& directory) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        trace_directory = directory.empty() ? "." : directory;

        std::error_code ec;
        std::filesystem::create_directories(trace_directory, ec);
        if (ec) {
            std::cerr << "Failed to create trace directory: " << trace_directory << " (" << ec.message() << ")" << std::endl;
        }

        // Reopen the trace file in the new location
        if (trace_file) {
            trace_file->close();
            trace_file.reset();
        }
        if (enabled && output_mode != "console") {
            OpenTraceFile();
        }
    }
    Info("TRACER", "Trace directory set to: " + directory);
}

void SpotmcpTracer::SetOutputMode(const std::string& output_mode) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->output_mode = output_mode;
        if (enabled && output_mode != "console" && !trace_file) {
            OpenTraceFile();
        }
    }
    Info("TRACER", "Trace output mode set to: " + output_mode);
}

void SpotmcpTracer::SetMaxFileSize(int64_t max_size) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        max_file_size = max_size;
    }
    Info("TRACER", "Trace max file size set to: " + std::to_string(max_size));
}

void SpotmcpTracer::SetRotation(bool rotation) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        rotation_enabled = rotation;
    }
    Info("TRACER", "Trace rotation " + std::string(rotation ? "enabled" : "disabled"));
}

void SpotmcpTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message) {
    if (!enabled || msg_level > level) {
        return;
    }

    std::string log_message;
    log_message.reserve(100 + component.length() + message.length());

    log_message += GetTimestamp();
    log_message += " [";
    log_message += LevelToString(msg_level);
    log_message += "] [";
    log_message += component;
    log_message += "] ";
    log_message += message;

    Emit(log_message);
}

void SpotmcpTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data) {
    if (!enabled || msg_level > level) {
        return;
    }

    std::string log_message;
    log_message.reserve(100 + component.length() + message.length() + data.length());

    log_message += GetTimestamp();
    log_message += " [";
    log_message += LevelToString(msg_level);
    log_message += "] [";
    log_message += component;
    log_message += "] ";
    log_message += message;

    if (!data.empty()) {
        log_message += "\nData: ";
        log_message += data;
    }

    Emit(log_message);
}

void SpotmcpTracer::Error(const std::string& component, const std::string& message) {
    Trace(TraceLevel::ERROR, component, message);
}

void SpotmcpTracer::Error(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::ERROR, component, message, data);
}

void SpotmcpTracer::Warn(const std::string& component, const std::string& message) {
    Trace(TraceLevel::WARN, component, message);
}

void SpotmcpTracer::Warn(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::WARN, component, message, data);
}

void SpotmcpTracer::Info(const std::string& component, const std::string& message) {
    Trace(TraceLevel::INFO, component, message);
}

void SpotmcpTracer::Info(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::INFO, component, message, data);
}

void SpotmcpTracer::Debug(const std::string& component, const std::string& message) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message);
}

void SpotmcpTracer::Debug(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message, data);
}

void SpotmcpTracer::Trace(const std::string& component, const std::string& message) {
    Trace(TraceLevel::TRACE, component, message);
}

void SpotmcpTracer::Trace(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::TRACE, component, message, data);
}

std::string SpotmcpTracer::Redact(const std::string& secret) {
    if (secret.length() <= 10) {
        return std::string(secret.length(), '*');
    }
    return secret.substr(0, 10) + "...";
}

void SpotmcpTracer::Emit(const std::string& log_message) {
    std::lock_guard<std::mutex> lock(trace_mutex);

    if (output_mode == "console" || output_mode == "both") {
        std::cerr << log_message << std::endl;
    }

    if (output_mode == "file" || output_mode == "both") {
        RotateIfNeeded();
        if (trace_file && trace_file->is_open()) {
            *trace_file << log_message << std::endl;
            trace_file->flush();
        }
    }
}

// Caller holds trace_mutex
void SpotmcpTracer::OpenTraceFile() {
    auto path = TraceFilePath();
    trace_file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!trace_file->is_open()) {
        std::cerr << "Failed to open trace file: " << path << std::endl;
        trace_file.reset();
    }
}

// Caller holds trace_mutex
void SpotmcpTracer::RotateIfNeeded() {
    if (!trace_file || !rotation_enabled || max_file_size <= 0) {
        return;
    }

    auto position = static_cast<int64_t>(trace_file->tellp());
    if (position < max_file_size) {
        return;
    }

    trace_file->close();
    auto path = TraceFilePath();
    std::error_code ec;
    std::filesystem::rename(path, path + ".1", ec);
    if (ec) {
        std::cerr << "Failed to rotate trace file: " << ec.message() << std::endl;
    }
    OpenTraceFile();
}

std::string SpotmcpTracer::TraceFilePath() const {
    std::filesystem::path trace_path = trace_directory;
    trace_path /= TRACE_FILE_NAME;
    return trace_path.string();
}

std::string SpotmcpTracer::GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &time_t);
#else
    localtime_r(&time_t, &local_tm);
#endif

    char time_buffer[32];
    std::strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%d %H:%M:%S", &local_tm);

    char ms_buffer[8];
    std::snprintf(ms_buffer, sizeof(ms_buffer), ".%03d", static_cast<int>(ms.count()));

    return std::string(time_buffer) + ms_buffer;
}

std::string SpotmcpTracer::LevelToString(TraceLevel level) {
    switch (level) {
        case TraceLevel::NONE: return "NONE";
        case TraceLevel::ERROR: return "ERROR";
        case TraceLevel::WARN: return "WARN";
        case TraceLevel::INFO: return "INFO";
        case TraceLevel::DEBUG_LEVEL: return "DEBUG";
        case TraceLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

} // namespace spotmcp
