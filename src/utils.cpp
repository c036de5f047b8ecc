#include "utils.h"
#include <algorithm>
#include <sstream>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <ctime>
#include <chrono>
#include <random>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <cctype>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <pwd.h>
#include <dirent.h>

namespace prompthub {
namespace utils {

namespace {
std::atomic<bool> debug_enabled(false);
}

// String utilities
std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, (last - first + 1));
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

size_t utf8Length(const std::string& str) {
    size_t count = 0;
    for (unsigned char c : str) {
        if ((c & 0xC0) != 0x80) count++;
    }
    return count;
}

// File utilities
bool fileExists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode));
}

bool dirExists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode));
}

bool createDir(const std::string& path) {
    return mkdir(path.c_str(), 0755) == 0;
}

bool createDirs(const std::string& path) {
    if (path.empty()) return false;
    if (dirExists(path)) return true;

    std::string parent = getDirname(path);
    if (parent != path && parent != "." && parent != "/" && !dirExists(parent)) {
        if (!createDirs(parent)) return false;
    }
    return createDir(path) || dirExists(path);
}

bool readFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return false;
    }
    out = buffer.str();
    return true;
}

bool writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    return file.good();
}

bool writeFileSync(const std::string& path, const std::string& content) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        std::cerr << "Cannot open " << path << ": " << std::strerror(errno) << std::endl;
        return false;
    }

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            std::cerr << "Write failed for " << path << ": " << std::strerror(errno) << std::endl;
            close(fd);
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (fsync(fd) != 0) {
        std::cerr << "fsync failed for " << path << ": " << std::strerror(errno) << std::endl;
        close(fd);
        return false;
    }
    return close(fd) == 0;
}

bool renameFile(const std::string& from, const std::string& to) {
    if (std::rename(from.c_str(), to.c_str()) != 0) {
        std::cerr << "Rename " << from << " -> " << to << " failed: " << std::strerror(errno) << std::endl;
        return false;
    }
    return true;
}

std::string uniqueTempPath(const std::string& path) {
    return path + "." + std::to_string(getpid()) + "." + generateId().substr(0, 8) + ".tmp";
}

bool writeFileAtomic(const std::string& path, const std::string& content) {
    std::string tmp = uniqueTempPath(path);
    if (!writeFileSync(tmp, content)) {
        removeFile(tmp);
        return false;
    }
    if (!renameFile(tmp, path)) {
        removeFile(tmp);
        return false;
    }
    return true;
}

bool removeFile(const std::string& path) {
    return std::remove(path.c_str()) == 0;
}

std::vector<std::string> listDir(const std::string& path) {
    std::vector<std::string> names;
    DIR* dir = opendir(path.c_str());
    if (!dir) return names;

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name != "." && name != "..") names.push_back(name);
    }
    closedir(dir);
    std::sort(names.begin(), names.end());
    return names;
}

// Path utilities
std::string getHomeDir() {
    const char* home = getenv("HOME");
    if (home) {
        return std::string(home);
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw) {
        return std::string(pw->pw_dir);
    }
    return "/tmp";
}

std::string joinPath(const std::string& p1, const std::string& p2) {
    if (p1.empty()) return p2;
    if (p2.empty()) return p1;
    if (p1.back() == '/') return p1 + p2;
    return p1 + "/" + p2;
}

std::string getBasename(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

std::string getDirname(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::string expandHome(const std::string& path) {
    if (path == "~") return getHomeDir();
    if (startsWith(path, "~/")) return joinPath(getHomeDir(), path.substr(2));
    return path;
}

// Time utilities
std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    struct tm tm_info;
    localtime_r(&time, &tm_info);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm_info);

    std::ostringstream ss;
    ss << buffer << "." << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

std::string getCompactTimestamp() {
    time_t now = time(nullptr);
    struct tm tm_info;
    localtime_r(&now, &tm_info);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm_info);
    return std::string(buffer);
}

// Identity and hashing
std::string generateId() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t hi = dis(gen);
    uint64_t lo = dis(gen);
    // RFC 4122 version 4, variant 1
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (hi >> 32) << "-"
       << std::setw(4) << ((hi >> 16) & 0xFFFF) << "-"
       << std::setw(4) << (hi & 0xFFFF) << "-"
       << std::setw(4) << (lo >> 48) << "-"
       << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

namespace {

const uint32_t SHA256_K[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

inline uint32_t rotr(uint32_t x, int n) {
    return (x >> n) | (x << (32 - n));
}

void sha256Block(uint32_t state[8], const unsigned char* block) {
    uint32_t w[64];
    for (int i = 0; i < 16; i++) {
        w[i] = (uint32_t(block[i * 4]) << 24) | (uint32_t(block[i * 4 + 1]) << 16) |
               (uint32_t(block[i * 4 + 2]) << 8) | uint32_t(block[i * 4 + 3]);
    }
    for (int i = 16; i < 64; i++) {
        uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    uint32_t a = state[0], b = state[1], c = state[2], d = state[3];
    uint32_t e = state[4], f = state[5], g = state[6], h = state[7];

    for (int i = 0; i < 64; i++) {
        uint32_t S1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
        uint32_t ch = (e & f) ^ (~e & g);
        uint32_t t1 = h + S1 + ch + SHA256_K[i] + w[i];
        uint32_t S0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
        uint32_t maj = (a & b) ^ (a & c) ^ (b & c);
        uint32_t t2 = S0 + maj;
        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    state[0] += a; state[1] += b; state[2] += c; state[3] += d;
    state[4] += e; state[5] += f; state[6] += g; state[7] += h;
}

} // namespace

std::string sha256Hex(const std::string& data) {
    uint32_t state[8] = {
        0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
        0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
    };

    // Message plus 0x80 terminator and 64-bit big-endian bit length, padded to 64 bytes
    std::string msg = data;
    uint64_t bit_len = static_cast<uint64_t>(data.size()) * 8;
    msg.push_back(static_cast<char>(0x80));
    while (msg.size() % 64 != 56) {
        msg.push_back('\0');
    }
    for (int i = 7; i >= 0; i--) {
        msg.push_back(static_cast<char>((bit_len >> (i * 8)) & 0xFF));
    }

    for (size_t off = 0; off < msg.size(); off += 64) {
        sha256Block(state, reinterpret_cast<const unsigned char*>(msg.data() + off));
    }

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint32_t v : state) {
        ss << std::setw(8) << v;
    }
    return ss.str();
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    // Walk the longer input fully so timing does not depend on the first mismatch
    size_t len = std::max(a.size(), b.size());
    unsigned char diff = static_cast<unsigned char>(a.size() != b.size());
    for (size_t i = 0; i < len; i++) {
        unsigned char ca = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
        unsigned char cb = i < b.size() ? static_cast<unsigned char>(b[i]) : 0;
        diff |= static_cast<unsigned char>(ca ^ cb);
    }
    return diff == 0;
}

// Diagnostics
void setDebug(bool enabled) {
    debug_enabled = enabled;
}

void debugLog(const std::string& message) {
    if (!debug_enabled) return;
    std::cerr << terminal::DIM << "[debug] " << message << terminal::RESET << std::endl;
}

// Terminal utilities
namespace terminal {

const char* RED = "\033[0;31m";
const char* GREEN = "\033[0;32m";
const char* YELLOW = "\033[1;33m";
const char* BLUE = "\033[0;34m";
const char* CYAN = "\033[0;36m";
const char* BOLD = "\033[1m";
const char* DIM = "\033[2m";
const char* RESET = "\033[0m";

void printError(const std::string& text) {
    std::cerr << RED << "✗ " << text << RESET << std::endl;
}

void printSuccess(const std::string& text) {
    std::cout << GREEN << "✓ " << text << RESET << std::endl;
}

void printWarning(const std::string& text) {
    std::cout << YELLOW << "⚠ " << text << RESET << std::endl;
}

void printInfo(const std::string& text) {
    std::cout << CYAN << text << RESET << std::endl;
}

} // namespace terminal

} // namespace utils
} // namespace prompthub
