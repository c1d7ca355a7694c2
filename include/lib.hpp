#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>
#include <random>
#include <cstdarg>
#include <cstdio>
#include <sstream>


using kv_pair = std::pair<std::string, std::string>;
using kv_list = std::vector<kv_pair>; // ordered key -> value

enum class ErrKind { Config, Catalog, FileSystem, Schema, Store, Exec };
enum class LogLevel { Debug, Info, Warn, Error, Off };

const char* errkind(ErrKind kind);

class ConvError : public std::runtime_error {
public:
    ConvError(ErrKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}
    ErrKind kind() const { return kind_; }
private:
    ErrKind kind_;
};

[[noreturn]] void error(ErrKind kind, const std::string& msg, const char* file, int line, ...);
// A helper macro to automatically pass __FILE__ and __LINE__
#define THROW(msg, ...) error(ErrKind::Config, msg, __FILE__, __LINE__, ##__VA_ARGS__)
#define THROW_AS(kind, msg, ...) error(kind, msg, __FILE__, __LINE__, ##__VA_ARGS__)

void set_log_level(LogLevel level);
LogLevel log_level();
void log_msg(LogLevel level, const char* file, int line, const char* msg, ...);
#define LOG_DEBUG(msg, ...) log_msg(LogLevel::Debug, __FILE__, __LINE__, msg, ##__VA_ARGS__)
#define LOG_INFO(msg, ...)  log_msg(LogLevel::Info,  __FILE__, __LINE__, msg, ##__VA_ARGS__)
#define LOG_WARN(msg, ...)  log_msg(LogLevel::Warn,  __FILE__, __LINE__, msg, ##__VA_ARGS__)
#define LOG_ERROR(msg, ...) log_msg(LogLevel::Error, __FILE__, __LINE__, msg, ##__VA_ARGS__)

class Random {
private:
    std::random_device rd;
    std::mt19937 gen;
public:
    Random() : gen(rd()) {}
    ~Random() = default;

    int get(int min, int max) {
        std::uniform_int_distribution<> distrib(min, max);
        return distrib(gen);
    }
};

namespace strhlp {

    // splits on any char of `seps`; trims tokens when asked, drops empty ones when asked
    std::vector<std::string> split(const std::string& s, const std::string& seps, bool omit_empty = true, bool trim_tokens = true);
    std::string join(const std::vector<std::string>& xs, const std::string& sep);
    std::string trim(const std::string& s);
    std::string lower(std::string s);
    bool iequals(const std::string& a, const std::string& b);
    bool icontains(const std::string& haystack, const std::string& needle);
    bool is_blank(const std::string& s);
    std::string replace_all(std::string s, const std::string& from, const std::string& to);

} // namespace strhlp
