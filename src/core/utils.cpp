#include "gwskynet/core/utils.hpp"
#include "gwskynet/core/errors.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>

#include <openssl/evp.h>

namespace gwskynet::core {

namespace {

using DigestCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestCtx new_sha256_ctx() {
    DigestCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw IOError("cannot initialise SHA-256 digest");
    }
    return ctx;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &len) != 1) {
        throw IOError("cannot finalise SHA-256 digest");
    }
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

} // namespace

std::string get_iso_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

// UTC stamp plus a random suffix, e.g. 20250101T120000Z-3fa9c1d0.
std::string get_run_id() {
    const std::time_t secs = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::random_device rd;
    std::uniform_int_distribution<unsigned int> dist;

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y%m%dT%H%M%SZ") << '-'
        << std::hex << std::setfill('0') << std::setw(8) << dist(rd);
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw IOError("Cannot create file: " + path.string());
    }
    out << text;
    if (!out) {
        throw IOError("Cannot write file: " + path.string());
    }
}

std::string sha256_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError("Cannot open file: " + path.string());
    }

    DigestCtx ctx = new_sha256_ctx();
    char buffer[1 << 16];
    while (in.read(buffer, sizeof(buffer)) || in.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(in.gcount())) != 1) {
            throw IOError("SHA-256 update failed for " + path.string());
        }
    }
    if (in.bad()) {
        throw IOError("Cannot read file: " + path.string());
    }
    return finish_hex(ctx.get());
}

std::string to_lower(const std::string& s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string to_upper(const std::string& s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

// Also strips the single quotes cfitsio leaves around string values.
std::string trim(const std::string& s) {
    const char* ws = " \t\r\n'";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    for (;;) {
        const auto pos = str.find(delimiter, start);
        parts.push_back(str.substr(start, pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += delimiter;
        out += parts[i];
    }
    return out;
}

} // namespace gwskynet::core
