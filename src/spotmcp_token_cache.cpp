#include "spotmcp_token_cache.hpp"
#include "spotmcp_tracing.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <yyjson.h>

namespace spotmcp {

namespace fs = std::filesystem;

namespace {

// Integral or real JSON numbers that fit into int64_t, reals truncated
std::optional<int64_t> GetInt64(yyjson_val* val) {
    if (!val) {
        return std::nullopt;
    }
    if (yyjson_is_uint(val)) {
        auto value = yyjson_get_uint(val);
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    if (yyjson_is_sint(val)) {
        return yyjson_get_sint(val);
    }
    if (yyjson_is_real(val)) {
        auto value = yyjson_get_real(val);
        // 2^63 is exactly representable, INT64_MAX is not
        if (!std::isfinite(value) || value < -9223372036854775808.0 || value >= 9223372036854775808.0) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    return std::nullopt;
}

// Absent and null fields read as 0, anything else must be a usable integer
bool ReadInt64Field(yyjson_val* root, const char* key, int64_t& out) {
    auto val = yyjson_obj_get(root, key);
    if (!val || yyjson_is_null(val)) {
        out = 0;
        return true;
    }
    auto value = GetInt64(val);
    if (!value) {
        SPOTMCP_TRACE_WARN("TOKEN_CACHE", std::string("Unusable value for ") + key + " in token cache");
        return false;
    }
    out = *value;
    return true;
}

std::string GetString(yyjson_val* val) {
    if (val && yyjson_is_str(val)) {
        return std::string(yyjson_get_str(val), yyjson_get_len(val));
    }
    return std::string();
}

} // anonymous namespace

TokenCache::TokenCache(std::string cache_file_path) : path(std::move(cache_file_path)) {
}

bool TokenCache::IsFresh(const TokenRecord& record, int64_t now) {
    return record.expires_at > now + TOKEN_EXPIRY_BUFFER_SECONDS;
}

bool TokenCache::Exists() const {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::optional<TokenRecord> TokenCache::Load() const {
    return Load(CurrentEpochSeconds());
}

std::optional<TokenRecord> TokenCache::Load(int64_t now) const {
    auto record = ReadRecord(true);
    if (!record) {
        return std::nullopt;
    }

    if (IsFresh(*record, now)) {
        SPOTMCP_TRACE_DEBUG("TOKEN_CACHE", "Cached access token is fresh, expires at " + std::to_string(record->expires_at));
        return record;
    }

    if (record->HasRefreshToken()) {
        SPOTMCP_TRACE_DEBUG("TOKEN_CACHE", "Cached access token is stale but refreshable");
        return record;
    }

    SPOTMCP_TRACE_INFO("TOKEN_CACHE", "Cached access token is stale and has no refresh token, ignoring cache");
    return std::nullopt;
}

std::optional<TokenRecord> TokenCache::ReadRecord(bool quarantine_corrupt) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        SPOTMCP_TRACE_DEBUG("TOKEN_CACHE", "No token cache at " + path);
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        SPOTMCP_TRACE_WARN("TOKEN_CACHE", "Token cache exists but cannot be opened: " + path);
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    auto record = Deserialize(buffer.str());
    if (!record) {
        SPOTMCP_TRACE_WARN("TOKEN_CACHE", "Token cache is corrupt: " + path);
        if (quarantine_corrupt) {
            QuarantineCorruptFile();
        }
        return std::nullopt;
    }
    return record;
}

void TokenCache::QuarantineCorruptFile() const {
    std::error_code ec;
    auto backup = path + ".bak";
    fs::rename(path, backup, ec);
    if (ec) {
        fs::remove(backup, ec);
        ec.clear();
        fs::rename(path, backup, ec);
    }
    if (ec) {
        SPOTMCP_TRACE_WARN("TOKEN_CACHE", "Could not move corrupt token cache aside: " + ec.message());
    } else {
        SPOTMCP_TRACE_INFO("TOKEN_CACHE", "Moved corrupt token cache to " + backup);
    }
}

TokenRecord TokenCache::Save(const TokenResponse& response) const {
    return Save(response, CurrentEpochSeconds());
}

TokenRecord TokenCache::Save(const TokenResponse& response, int64_t now) const {
    TokenRecord record;
    record.access_token = response.access_token;
    record.token_type = response.token_type.empty() ? std::string("Bearer") : response.token_type;
    record.expires_in = response.expires_in;
    record.refresh_token = response.refresh_token;
    record.scope = response.scope;
    record.expires_at = now + response.expires_in;

    if (record.refresh_token.empty()) {
        auto previous = ReadRecord(false);
        if (previous && previous->HasRefreshToken()) {
            SPOTMCP_TRACE_DEBUG("TOKEN_CACHE", "Response carried no refresh token, keeping the cached one");
            record.refresh_token = previous->refresh_token;
        }
    }

    std::string error;
    if (!WriteAtomic(Serialize(record), error)) {
        SPOTMCP_TRACE_WARN("TOKEN_CACHE", "Failed to save token cache: " + error);
    } else {
        SPOTMCP_TRACE_INFO("TOKEN_CACHE", "Saved token cache to " + path + ", expires at " + std::to_string(record.expires_at));
    }
    return record;
}

bool TokenCache::Clear() const {
    std::error_code ec;
    auto removed = fs::remove(path, ec);
    if (ec) {
        SPOTMCP_TRACE_WARN("TOKEN_CACHE", "Failed to remove token cache: " + ec.message());
        return false;
    }
    if (removed) {
        SPOTMCP_TRACE_INFO("TOKEN_CACHE", "Removed token cache " + path);
    }
    return removed;
}

bool TokenCache::WriteAtomic(const std::string& content, std::string& error) const {
    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "Failed to create cache directory " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    auto tmp = target;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file) {
            error = "Failed to open temp file for write: " + tmp.string();
            return false;
        }
        file << content;
        file.flush();
        if (!file) {
            error = "Failed while writing temp file: " + tmp.string();
            return false;
        }
    }

    // Tokens are credentials: owner read/write only
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    ec.clear();

    fs::rename(tmp, target, ec);
    if (ec) {
        // Rename over an existing file fails on some platforms
        fs::remove(target, ec);
        ec.clear();
        fs::rename(tmp, target, ec);
    }
    if (ec) {
        error = "Failed to replace token cache atomically: " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

std::string TokenCache::Serialize(const TokenRecord& record) {
    auto doc = std::shared_ptr<yyjson_mut_doc>(yyjson_mut_doc_new(nullptr), yyjson_mut_doc_free);
    auto root = yyjson_mut_obj(doc.get());
    yyjson_mut_doc_set_root(doc.get(), root);

    yyjson_mut_obj_add_strcpy(doc.get(), root, "access_token", record.access_token.c_str());
    yyjson_mut_obj_add_strcpy(doc.get(), root, "token_type", record.token_type.c_str());
    yyjson_mut_obj_add_int(doc.get(), root, "expires_in", record.expires_in);
    yyjson_mut_obj_add_strcpy(doc.get(), root, "refresh_token", record.refresh_token.c_str());
    yyjson_mut_obj_add_strcpy(doc.get(), root, "scope", record.scope.c_str());
    yyjson_mut_obj_add_int(doc.get(), root, "expires_at", record.expires_at);

    size_t len = 0;
    char* json = yyjson_mut_write(doc.get(), YYJSON_WRITE_PRETTY, &len);
    if (!json) {
        throw std::runtime_error("Failed to serialize token record");
    }
    std::string result(json, len);
    free(json);
    return result;
}

std::optional<TokenRecord> TokenCache::Deserialize(const std::string& json) {
    auto doc = std::shared_ptr<yyjson_doc>(yyjson_read(json.c_str(), json.size(), 0), yyjson_doc_free);
    if (!doc) {
        return std::nullopt;
    }

    auto root = yyjson_doc_get_root(doc.get());
    if (!root || !yyjson_is_obj(root)) {
        return std::nullopt;
    }

    TokenRecord record;
    record.access_token = GetString(yyjson_obj_get(root, "access_token"));
    if (record.access_token.empty()) {
        return std::nullopt;
    }

    auto token_type = GetString(yyjson_obj_get(root, "token_type"));
    if (!token_type.empty()) {
        record.token_type = token_type;
    }
    record.refresh_token = GetString(yyjson_obj_get(root, "refresh_token"));
    record.scope = GetString(yyjson_obj_get(root, "scope"));
    if (!ReadInt64Field(root, "expires_in", record.expires_in) ||
        !ReadInt64Field(root, "expires_at", record.expires_at)) {
        return std::nullopt;
    }

    return record;
}

} // namespace spotmcp
