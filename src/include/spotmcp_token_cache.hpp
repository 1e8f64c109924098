#pragma once

#include "spotmcp_auth_types.hpp"
#include <optional>
#include <string>

namespace spotmcp {

// Persists the most recently issued token set as pretty JSON. Reads never
// throw: a missing or damaged file is simply "no cache".
class TokenCache {
public:
    explicit TokenCache(std::string cache_file_path);

    // Usable record or nothing. Stale records come back only when they can be refreshed.
    std::optional<TokenRecord> Load() const;
    std::optional<TokenRecord> Load(int64_t now) const;

    // expires_at = now + expires_in, refresh_token carried over when omitted.
    // Write failures are logged, the merged record is returned regardless.
    TokenRecord Save(const TokenResponse& response) const;
    TokenRecord Save(const TokenResponse& response, int64_t now) const;

    // Removes the cache file; true if something was deleted
    bool Clear() const;

    bool Exists() const;

    const std::string& GetPath() const { return path; }

    // expires_at strictly beyond now + 300 seconds
    static bool IsFresh(const TokenRecord& record, int64_t now);

    static std::string Serialize(const TokenRecord& record);
    static std::optional<TokenRecord> Deserialize(const std::string& json);

private:
    std::string path;

    // Raw read without freshness rules; quarantines unparseable files
    std::optional<TokenRecord> ReadRecord(bool quarantine_corrupt) const;
    void QuarantineCorruptFile() const;
    bool WriteAtomic(const std::string& content, std::string& error) const;
};

} // namespace spotmcp
