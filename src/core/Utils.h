#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>

namespace ioc_sweep {
namespace utils {

// Reads up to max_bytes from path. nullopt when the file cannot be opened.
std::optional<std::string> read_file(const std::string& path, size_t max_bytes = 1 << 20);

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::vector<std::string> split_csv(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

bool is_valid_pid(const char* str, int* pid_out = nullptr);

// "0644" style rendering / parsing of permission bits. parse rejects values above 07777.
std::string format_mode(unsigned mode);
bool parse_mode(const std::string& text, unsigned& out);

std::string time_to_iso(std::chrono::system_clock::time_point tp);
std::string errno_text(int err);

}
}
