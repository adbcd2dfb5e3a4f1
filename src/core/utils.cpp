#include "planform/core/utils.hpp"
#include "planform/core/errors.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <memory>
#include <random>

#include <openssl/evp.h>

namespace planform::core {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string hex_digest(const unsigned char* digest, unsigned int len) {
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0x0f]);
    }
    return out;
}

} // namespace

std::string get_iso_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const long millis =
        static_cast<long>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm utc{};
    gmtime_r(&secs, &utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    char stamp[40];
    std::snprintf(stamp, sizeof(stamp), "%s.%03ldZ", date, millis);
    return stamp;
}

// pf_<UTC yyyymmddTHHMMSS>_<6 hex digits>
std::string get_run_id() {
    const std::time_t secs = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&secs, &utc);

    char date[24];
    std::strftime(date, sizeof(date), "%Y%m%dT%H%M%S", &utc);

    std::random_device rd;
    const unsigned suffix = rd() & 0xffffffu;

    char id[48];
    std::snprintf(id, sizeof(id), "pf_%s_%06x", date, suffix);
    return id;
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw IOError("Cannot create file: " + path.string());
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.close();
    if (out.fail()) {
        throw IOError("Cannot write file: " + path.string());
    }
}

std::string sha256_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("Cannot open file for hashing: " + path.string());
    }

    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw IOError("Cannot initialise SHA-256 digest");
    }

    char chunk[1 << 14];
    while (in) {
        in.read(chunk, sizeof(chunk));
        const std::streamsize got = in.gcount();
        if (got > 0 &&
            EVP_DigestUpdate(ctx.get(), chunk, static_cast<size_t>(got)) != 1) {
            throw IOError("SHA-256 update failed for " + path.string());
        }
    }
    if (in.bad()) {
        throw IOError("Cannot read file for hashing: " + path.string());
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw IOError("SHA-256 finalisation failed for " + path.string());
    }
    return hex_digest(digest, len);
}

std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

} // namespace planform::core
