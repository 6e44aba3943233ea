#include "PreferenceStore.h"
#include "../core/Utils.h"
#include "../core/Logging.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <cstdlib>
#include <vector>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using nlohmann::json;

namespace ioc_sweep {

std::string JsonPreferenceStore::location(const ScopeContext& scope, const std::string& domain) const {
    fs::path dir = scope.kind == ScopeKind::PerUser ? fs::path(scope.home) / user_subdir_ : fs::path(system_dir_);
    return (dir / (domain + ".json")).string();
}

static std::string scalar_text(const json& v){
    if(v.is_string()) return v.get<std::string>();
    if(v.is_boolean()) return v.get<bool>() ? "true" : "false";
    return v.dump();
}

PreferenceRead JsonPreferenceStore::read(const ScopeContext& scope, const std::string& domain, const std::string& key) const {
    PreferenceRead out;
    std::string path = location(scope, domain);
    struct stat st{};
    if(stat(path.c_str(), &st) != 0){
        if(errno == ENOENT || errno == ENOTDIR) return out; // undefined domain: key absent
        out.ok = false;
        out.error = path + ": " + utils::errno_text(errno);
        return out;
    }
    auto text = utils::read_file(path, 4 << 20);
    if(!text){
        out.ok = false;
        out.error = "cannot read " + path;
        return out;
    }
    json doc;
    try {
        doc = json::parse(*text);
    } catch(const json::parse_error& ex){
        out.ok = false;
        out.error = path + ": " + ex.what();
        return out;
    }
    if(!doc.is_object()){
        out.ok = false;
        out.error = path + ": preference domain is not an object";
        return out;
    }
    auto it = doc.find(key);
    if(it == doc.end() || it->is_null()) return out;
    out.found = true;
    if(it->is_array()){
        out.value.is_array = true;
        for(const auto& e : *it) out.value.values.push_back(scalar_text(e));
    } else if(it->is_object()){
        out.value.values.push_back(it->dump());
    } else {
        out.value.values.push_back(scalar_text(*it));
    }
    return out;
}

static bool write_all(int fd, const std::string& data){
    size_t done = 0;
    while(done < data.size()){
        ssize_t n = ::write(fd, data.data() + done, data.size() - done);
        if(n < 0){
            if(errno == EINTR) continue;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

bool JsonPreferenceStore::write(const ScopeContext& scope, const std::string& domain, const std::string& key,
                                const PreferenceValue& value, std::string& error){
    std::string path = location(scope, domain);
    json doc = json::object();
    struct stat st{};
    bool exists = lstat(path.c_str(), &st) == 0;
    if(exists && !S_ISREG(st.st_mode)){
        error = path + ": refusing to replace a non-regular preference domain";
        return false;
    }
    if(exists){
        auto text = utils::read_file(path, 4 << 20);
        if(!text){ error = "cannot read " + path; return false; }
        try {
            doc = json::parse(*text);
        } catch(const json::parse_error& ex){
            error = path + ": refusing to overwrite malformed domain: " + ex.what();
            return false;
        }
        if(!doc.is_object()){ error = path + ": preference domain is not an object"; return false; }
    }
    if(value.is_array) doc[key] = value.values;
    else doc[key] = value.values.empty() ? std::string() : value.values.front();

    fs::path parent = fs::path(path).parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if(ec){ error = "cannot create " + parent.string() + ": " + ec.message(); return false; }
    struct stat dir_st{};
    if(lstat(parent.c_str(), &dir_st) != 0 || !S_ISDIR(dir_st.st_mode)){
        error = parent.string() + ": preference directory is not a plain directory";
        return false;
    }

    // Owner of the result: the previous domain's, else the home directory's for a user scope.
    struct stat owner{};
    bool have_owner = exists;
    if(exists) owner = st;
    else if(scope.kind == ScopeKind::PerUser) have_owner = stat(scope.home.c_str(), &owner) == 0;

    // mkstemp creates the temp file exclusively, so nothing planted under its name is followed.
    std::string tmpl = path + ".XXXXXX";
    std::vector<char> tmp_name(tmpl.begin(), tmpl.end());
    tmp_name.push_back('\0');
    int fd = ::mkstemp(tmp_name.data());
    if(fd < 0){ error = "cannot create temp file for " + path + ": " + utils::errno_text(errno); return false; }
    std::string tmp(tmp_name.data());
    auto abandon = [&](const std::string& what){
        error = what + " " + tmp + ": " + utils::errno_text(errno);
        ::close(fd);
        ::unlink(tmp.c_str());
        return false;
    };
    if(!write_all(fd, doc.dump(2) + "\n")) return abandon("write failed for");
    if(::fchmod(fd, exists ? (st.st_mode & 07777) : 0644) != 0) return abandon("cannot set mode on");
    if(have_owner && (owner.st_uid != geteuid() || owner.st_gid != getegid())){
        if(::fchown(fd, owner.st_uid, owner.st_gid) != 0){
            Logger::instance().warn("Could not hand " + path + " to uid " + std::to_string(owner.st_uid) + ": " + utils::errno_text(errno));
        }
    }
    if(::fsync(fd) != 0) return abandon("fsync failed for");
    if(::close(fd) != 0){
        error = "close failed for " + tmp + ": " + utils::errno_text(errno);
        ::unlink(tmp.c_str());
        return false;
    }
    if(std::rename(tmp.c_str(), path.c_str()) != 0){
        error = "rename to " + path + " failed: " + utils::errno_text(errno);
        ::unlink(tmp.c_str());
        return false;
    }
    return true;
}

}
