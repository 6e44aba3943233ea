#include "Scope.h"
#include "Logging.h"
#include <algorithm>
#include <filesystem>
#include <pwd.h>
#include <unistd.h>
#include <cerrno>

namespace fs = std::filesystem;

namespace ioc_sweep {

bool PasswdAccountDirectory::account_exists(const std::string& name) const {
    long sz = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buf(sz > 0 ? static_cast<size_t>(sz) : 16384);
    struct passwd pw{};
    struct passwd* result = nullptr;
    int rc;
    while((rc = getpwnam_r(name.c_str(), &pw, buf.data(), buf.size(), &result)) == ERANGE){
        buf.resize(buf.size() * 2);
    }
    return rc == 0 && result != nullptr;
}

ScopeEnumerator::ScopeEnumerator(std::string home_root, std::vector<std::string> skip_accounts, const AccountDirectory& accounts)
    : home_root_(std::move(home_root)), skip_accounts_(std::move(skip_accounts)), accounts_(accounts) {}

bool ScopeEnumerator::skipped(const std::string& name) const {
    if(name.empty() || name[0] == '.') return true;
    return std::find(skip_accounts_.begin(), skip_accounts_.end(), name) != skip_accounts_.end();
}

std::vector<ScopeContext> ScopeEnumerator::user_scopes() const {
    std::vector<ScopeContext> out;
    std::error_code ec;
    fs::directory_iterator it(home_root_, fs::directory_options::skip_permission_denied, ec);
    if(ec){
        Logger::instance().warn("Cannot list home root " + home_root_ + ": " + ec.message());
        return out;
    }
    for(; it != fs::directory_iterator(); it.increment(ec)){
        if(ec) break;
        if(!it->is_directory(ec) || it->is_symlink(ec)) continue;
        std::string name = it->path().filename().string();
        if(skipped(name)){
            Logger::instance().debug("Skipping shared home directory: " + it->path().string());
            continue;
        }
        if(!accounts_.account_exists(name)){
            Logger::instance().debug("Skipping home directory without account: " + it->path().string());
            continue;
        }
        out.push_back(ScopeContext::for_user(name, it->path().string()));
    }
    std::sort(out.begin(), out.end(), [](const ScopeContext& a, const ScopeContext& b){ return a.user < b.user; });
    return out;
}

}
