#ifndef PROMPTHUB_UTILS_H
#define PROMPTHUB_UTILS_H

#include <string>
#include <vector>

namespace prompthub {
namespace utils {

// String utilities
std::string trim(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& separator);
bool startsWith(const std::string& str, const std::string& prefix);
bool endsWith(const std::string& str, const std::string& suffix);
std::string toLower(const std::string& str);
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);
size_t utf8Length(const std::string& str);

// File utilities
bool fileExists(const std::string& path);
bool dirExists(const std::string& path);
bool createDir(const std::string& path);
bool createDirs(const std::string& path);
bool readFile(const std::string& path, std::string& out);
bool writeFile(const std::string& path, const std::string& content);
bool writeFileSync(const std::string& path, const std::string& content);
bool renameFile(const std::string& from, const std::string& to);
// "<path>.<pid>.<random>.tmp", never shared between writers
std::string uniqueTempPath(const std::string& path);
// Writes to a unique temp file beside path, fsyncs, then renames over path
bool writeFileAtomic(const std::string& path, const std::string& content);
bool removeFile(const std::string& path);
// Entry names without "." and "..", sorted
std::vector<std::string> listDir(const std::string& path);

// Path utilities
std::string getHomeDir();
std::string joinPath(const std::string& p1, const std::string& p2);
std::string getBasename(const std::string& path);
std::string getDirname(const std::string& path);
std::string expandHome(const std::string& path);

// Time utilities
std::string getCurrentTimestamp();          // 2024-05-01T12:30:00.123456
std::string getCompactTimestamp();          // 20240501_123000

// Identity and hashing
std::string generateId();
std::string sha256Hex(const std::string& data);
bool constantTimeEquals(const std::string& a, const std::string& b);

// Diagnostics
void setDebug(bool enabled);
void debugLog(const std::string& message);

// Terminal utilities
namespace terminal {
    // ANSI colors
    extern const char* RED;
    extern const char* GREEN;
    extern const char* YELLOW;
    extern const char* BLUE;
    extern const char* CYAN;
    extern const char* BOLD;
    extern const char* DIM;
    extern const char* RESET;

    // Colored output
    void printError(const std::string& text);
    void printSuccess(const std::string& text);
    void printWarning(const std::string& text);
    void printInfo(const std::string& text);
}

} // namespace utils
} // namespace prompthub

#endif // PROMPTHUB_UTILS_H
