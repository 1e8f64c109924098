#include "catch2/catch.hpp"
#include "spotmcp_token_cache.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <limits>

using namespace spotmcp;
using namespace spotmcp::test;

namespace {

TokenResponse MakeResponse(const std::string& access_token, const std::string& refresh_token, int64_t expires_in = 3600) {
    TokenResponse response;
    response.access_token = access_token;
    response.token_type = "Bearer";
    response.expires_in = expires_in;
    response.refresh_token = refresh_token;
    response.scope = "user-read-email user-library-read";
    return response;
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    file << content;
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}

TEST_CASE("Token cache freshness boundary", "[token_cache]") {
    const int64_t now = 1700000000;
    TokenRecord record;
    record.access_token = "token";

    SECTION("Exactly five minutes left is not fresh") {
        record.expires_at = now + 300;
        REQUIRE_FALSE(TokenCache::IsFresh(record, now));
    }

    SECTION("Five minutes and one second left is fresh") {
        record.expires_at = now + 301;
        REQUIRE(TokenCache::IsFresh(record, now));
    }

    SECTION("Already expired is not fresh") {
        record.expires_at = now - 10;
        REQUIRE_FALSE(TokenCache::IsFresh(record, now));
    }
}

TEST_CASE("Token cache save and load", "[token_cache]") {
    TempDir dir;
    auto path = dir.Path() / "token-cache.json";
    TokenCache cache(path.string());

    SECTION("Missing file loads as absent") {
        REQUIRE_FALSE(cache.Exists());
        REQUIRE_FALSE(cache.Load().has_value());
    }

    SECTION("Round trip with a fixed clock") {
        const int64_t now = 1700000000;
        auto saved = cache.Save(MakeResponse("access-1", "refresh-1"), now);
        REQUIRE(saved.expires_at == now + 3600);

        auto loaded = cache.Load(now);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->access_token == "access-1");
        REQUIRE(loaded->refresh_token == "refresh-1");
        REQUIRE(loaded->token_type == "Bearer");
        REQUIRE(loaded->expires_in == 3600);
        REQUIRE(loaded->scope == "user-read-email user-library-read");
        REQUIRE(loaded->expires_at == now + 3600);
    }

    SECTION("expires_at is taken from the local clock") {
        auto before = CurrentEpochSeconds();
        cache.Save(MakeResponse("access-1", "refresh-1"));
        auto after = CurrentEpochSeconds();

        auto loaded = cache.Load();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->expires_at >= before + 3600);
        REQUIRE(loaded->expires_at <= after + 3600);
    }

    SECTION("Parent directories are created and no temp file is left behind") {
        auto nested = dir.Path() / "a" / "b" / "token-cache.json";
        TokenCache nested_cache(nested.string());
        nested_cache.Save(MakeResponse("access-1", "refresh-1"));
        REQUIRE(std::filesystem::exists(nested));
        REQUIRE_FALSE(std::filesystem::exists(nested.string() + ".tmp"));
    }

    SECTION("Saved file is a pretty printed JSON object with all fields") {
        cache.Save(MakeResponse("access-1", ""), 1700000000);
        auto content = ReadFile(path);
        REQUIRE(content.find('\n') != std::string::npos);
        REQUIRE(content.find("\"access_token\"") != std::string::npos);
        REQUIRE(content.find("\"expires_at\"") != std::string::npos);
        REQUIRE(content.find("\"refresh_token\": \"\"") != std::string::npos);
    }

    SECTION("Clear removes the file") {
        cache.Save(MakeResponse("access-1", "refresh-1"));
        REQUIRE(cache.Clear());
        REQUIRE_FALSE(cache.Exists());
        REQUIRE_FALSE(cache.Clear());
    }
}

TEST_CASE("Token cache refresh token handling", "[token_cache]") {
    TempDir dir;
    TokenCache cache((dir.Path() / "token-cache.json").string());
    const int64_t now = 1700000000;

    SECTION("Existing refresh token survives a response without one") {
        cache.Save(MakeResponse("access-1", "refresh-1"), now);
        auto merged = cache.Save(MakeResponse("access-2", ""), now + 100);
        REQUIRE(merged.access_token == "access-2");
        REQUIRE(merged.refresh_token == "refresh-1");

        auto loaded = cache.Load(now + 100);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->refresh_token == "refresh-1");
    }

    SECTION("A rotated refresh token replaces the old one") {
        cache.Save(MakeResponse("access-1", "refresh-1"), now);
        cache.Save(MakeResponse("access-2", "refresh-2"), now);
        REQUIRE(cache.Load(now)->refresh_token == "refresh-2");
    }

    SECTION("Stale record with a refresh token is still returned") {
        cache.Save(MakeResponse("access-1", "refresh-1", 3600), now);
        auto loaded = cache.Load(now + 3500);
        REQUIRE(loaded.has_value());
        REQUIRE_FALSE(TokenCache::IsFresh(*loaded, now + 3500));
        REQUIRE(loaded->HasRefreshToken());
    }

    SECTION("Stale record without a refresh token is absent") {
        cache.Save(MakeResponse("access-1", "", 3600), now);
        REQUIRE(cache.Load(now).has_value());
        REQUIRE_FALSE(cache.Load(now + 3500).has_value());
    }
}

TEST_CASE("Token cache corruption handling", "[token_cache]") {
    TempDir dir;
    auto path = dir.Path() / "token-cache.json";
    TokenCache cache(path.string());

    SECTION("Malformed JSON is treated as no cache and kept as .bak") {
        WriteFile(path, "{ this is not json");
        REQUIRE_FALSE(cache.Load().has_value());
        REQUIRE_FALSE(std::filesystem::exists(path));
        REQUIRE(std::filesystem::exists(path.string() + ".bak"));
        REQUIRE(ReadFile(path.string() + ".bak") == "{ this is not json");
    }

    SECTION("Object without an access token is corrupt") {
        WriteFile(path, R"({"token_type": "Bearer", "expires_at": 99999999999})");
        REQUIRE_FALSE(cache.Load().has_value());
        REQUIRE(std::filesystem::exists(path.string() + ".bak"));
    }

    SECTION("Out of range expiry is corrupt") {
        WriteFile(path, R"({"access_token": "abc", "expires_at": 1e300})");
        REQUIRE_FALSE(cache.Load().has_value());
        REQUIRE_FALSE(std::filesystem::exists(path));
        REQUIRE(std::filesystem::exists(path.string() + ".bak"));
    }

    SECTION("A JSON array is corrupt") {
        WriteFile(path, "[1, 2, 3]");
        REQUIRE_FALSE(cache.Load().has_value());
    }

    SECTION("Saving after corruption writes a fresh file") {
        WriteFile(path, "garbage");
        REQUIRE_FALSE(cache.Load().has_value());
        cache.Save(MakeResponse("access-1", "refresh-1"));
        REQUIRE(cache.Load().has_value());
    }
}

TEST_CASE("Token cache write failures are not fatal", "[token_cache]") {
    TempDir dir;
    // A non-empty directory where the cache file should be cannot be replaced
    auto path = dir.Path() / "token-cache.json";
    std::filesystem::create_directories(path);
    WriteFile(path / "occupied", "x");

    TokenCache cache(path.string());
    TokenRecord record;
    REQUIRE_NOTHROW(record = cache.Save(MakeResponse("access-1", "refresh-1"), 1700000000));
    REQUIRE(record.access_token == "access-1");
    REQUIRE(record.expires_at == 1700000000 + 3600);
    REQUIRE(std::filesystem::is_directory(path));
}

TEST_CASE("Token record serialization", "[token_cache]") {
    SECTION("Absent optional fields fall back to defaults") {
        auto record = TokenCache::Deserialize(R"({"access_token": "abc"})");
        REQUIRE(record.has_value());
        REQUIRE(record->token_type == "Bearer");
        REQUIRE(record->refresh_token.empty());
        REQUIRE_FALSE(record->HasRefreshToken());
        REQUIRE(record->expires_at == 0);
    }

    SECTION("Null expiry reads as zero") {
        auto record = TokenCache::Deserialize(R"({"access_token": "abc", "expires_in": null})");
        REQUIRE(record.has_value());
        REQUIRE(record->expires_in == 0);
    }

    SECTION("Expiry values that do not fit a 64-bit integer are rejected") {
        REQUIRE_FALSE(TokenCache::Deserialize(R"({"access_token": "abc", "expires_at": 1e300})").has_value());
        REQUIRE_FALSE(TokenCache::Deserialize(R"({"access_token": "abc", "expires_at": -1e300})").has_value());
        REQUIRE_FALSE(TokenCache::Deserialize(R"({"access_token": "abc", "expires_at": 9223372036854775808.0})").has_value());
        REQUIRE_FALSE(TokenCache::Deserialize(R"({"access_token": "abc", "expires_in": 18446744073709551615})").has_value());
        REQUIRE_FALSE(TokenCache::Deserialize(R"({"access_token": "abc", "expires_at": "soon"})").has_value());
    }

    SECTION("Largest 64-bit timestamp is accepted") {
        auto record = TokenCache::Deserialize(R"({"access_token": "abc", "expires_at": 9223372036854775807})");
        REQUIRE(record.has_value());
        REQUIRE(record->expires_at == std::numeric_limits<int64_t>::max());
    }

    SECTION("Floating point timestamps are accepted") {
        auto record = TokenCache::Deserialize(R"({"access_token": "abc", "expires_at": 1700000000.75})");
        REQUIRE(record.has_value());
        REQUIRE(record->expires_at == 1700000000);
    }

    SECTION("Serialized record parses back") {
        TokenRecord record;
        record.access_token = "abc";
        record.refresh_token = "def";
        record.scope = "user-read-email";
        record.expires_in = 3600;
        record.expires_at = 1700003600;

        auto parsed = TokenCache::Deserialize(TokenCache::Serialize(record));
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->refresh_token == "def");
        REQUIRE(parsed->expires_at == 1700003600);
    }
}
