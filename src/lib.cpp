#include "lib.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace {

    std::atomic<LogLevel> g_level { LogLevel::Info };
    std::mutex g_log_mx;

    // Two pass vsnprintf: size first, then write into an exact buffer.
    std::string vformat(const char* msg, va_list args) {
        va_list args_copy;
        va_copy(args_copy, args);
        int required_size = std::vsnprintf(nullptr, 0, msg, args_copy);
        va_end(args_copy);

        if (required_size < 0) {
            throw std::runtime_error("Error: Failed to determine required buffer size.");
        }

        std::vector<char> buffer(required_size + 1);
        std::vsnprintf(buffer.data(), buffer.size(), msg, args);
        return std::string(buffer.data(), required_size);
    }

    const char* level_name(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info:  return "INFO";
            case LogLevel::Warn:  return "WARN";
            case LogLevel::Error: return "ERROR";
            case LogLevel::Off:   return "OFF";
        }
        return "?";
    }
}

const char* errkind(ErrKind kind) {
    switch (kind) {
        case ErrKind::Config:     return "config";
        case ErrKind::Catalog:    return "catalog";
        case ErrKind::FileSystem: return "filesystem";
        case ErrKind::Schema:     return "schema";
        case ErrKind::Store:      return "store";
        case ErrKind::Exec:       return "exec";
    }
    return "unknown";
}

void error(ErrKind kind, const std::string& msg, const char* file, int line, ...) {
    va_list args;
    va_start(args, line);
    std::string text = vformat(msg.c_str(), args);
    va_end(args);

    std::stringstream ss;
    ss << file << ":" << line << ": " << text;
    throw ConvError(kind, ss.str());
}

void set_log_level(LogLevel level) { g_level = level; }

LogLevel log_level() { return g_level; }

void log_msg(LogLevel level, const char* file, int line, const char* msg, ...) {
    if (level < g_level.load() || level == LogLevel::Off) return;

    va_list args;
    va_start(args, msg);
    std::string text = vformat(msg, args);
    va_end(args);

    std::lock_guard<std::mutex> lk(g_log_mx);
    std::cerr << "[" << level_name(level) << "] " << file << ":" << line << ": " << text << std::endl;
}

namespace strhlp {

    std::vector<std::string> split(const std::string& s, const std::string& seps, bool omit_empty, bool trim_tokens) {
        std::vector<std::string> out;
        std::string cur;
        auto flush = [&]() {
            std::string tok = trim_tokens ? trim(cur) : cur;
            if (!(omit_empty && tok.empty())) out.push_back(tok);
            cur.clear();
        };
        for (char c : s) {
            if (seps.find(c) != std::string::npos) flush();
            else cur += c;
        }
        flush();
        return out;
    }

    std::string join(const std::vector<std::string>& xs, const std::string& sep) {
        std::ostringstream os;
        for (size_t i = 0; i < xs.size(); ++i) {
            if (i) os << sep;
            os << xs[i];
        }
        return os.str();
    }

    std::string trim(const std::string& s) {
        size_t b = 0, e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return s.substr(b, e - b);
    }

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool iequals(const std::string& a, const std::string& b) {
        return lower(a) == lower(b);
    }

    bool icontains(const std::string& haystack, const std::string& needle) {
        return lower(haystack).find(lower(needle)) != std::string::npos;
    }

    bool is_blank(const std::string& s) {
        return trim(s).empty();
    }

    std::string replace_all(std::string s, const std::string& from, const std::string& to) {
        if (from.empty()) return s;
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }
        return s;
    }

} // namespace strhlp
