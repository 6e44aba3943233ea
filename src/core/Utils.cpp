#include "Utils.h"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace ioc_sweep {
namespace utils {

std::optional<std::string> read_file(const std::string& path, size_t max_bytes){
    std::ifstream in(path, std::ios::binary);
    if(!in) return std::nullopt;
    std::string out;
    char buf[8192];
    while(out.size() < max_bytes && in){
        size_t want = std::min(sizeof(buf), max_bytes - out.size());
        in.read(buf, static_cast<std::streamsize>(want));
        std::streamsize got = in.gcount();
        if(got <= 0) break;
        out.append(buf, static_cast<size_t>(got));
    }
    if(in.bad()) return std::nullopt;
    return out;
}

std::string trim(const std::string& s){
    size_t start = s.find_first_not_of(" \t\r\n");
    if(start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c : s){
        if(c==','){ cur = trim(cur); if(!cur.empty()) out.push_back(cur); cur.clear(); }
        else cur.push_back(c);
    }
    cur = trim(cur);
    if(!cur.empty()) out.push_back(cur);
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep){
    std::string out;
    for(size_t i=0;i<parts.size();++i){ if(i) out += sep; out += parts[i]; }
    return out;
}

bool is_valid_pid(const char* str, int* pid_out){
    if(!str || !*str) return false;
    char* endptr = nullptr;
    long val = strtol(str, &endptr, 10);
    if(*endptr != '\0' || val <= 0 || val > INT_MAX) return false;
    if(pid_out) *pid_out = static_cast<int>(val);
    return true;
}

std::string format_mode(unsigned mode){
    std::ostringstream os;
    os << std::oct << std::setw(4) << std::setfill('0') << (mode & 07777);
    return os.str();
}

bool parse_mode(const std::string& text, unsigned& out){
    std::string t = trim(text);
    if(t.empty() || t.size() > 5) return false;
    unsigned v = 0;
    for(char c : t){
        if(c < '0' || c > '7') return false;
        v = v * 8 + static_cast<unsigned>(c - '0');
    }
    if(v > 07777) return false;
    out = v;
    return true;
}

std::string time_to_iso(std::chrono::system_clock::time_point tp){
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string errno_text(int err){
    return std::error_code(err, std::generic_category()).message();
}

}
}
