#pragma once
#include "Indicator.h"
#include <string>
#include <vector>
#include <memory>

namespace ioc_sweep {

// Resolved evaluation context. Home/user are empty for the system-wide scope.
struct ScopeContext {
    ScopeKind kind = ScopeKind::SystemWide;
    std::string user;
    std::string home;

    static ScopeContext system() { return ScopeContext{}; }
    static ScopeContext for_user(std::string name, std::string home_dir){
        return ScopeContext{ScopeKind::PerUser, std::move(name), std::move(home_dir)};
    }
    std::string label() const { return kind == ScopeKind::SystemWide ? "system" : "user:" + user; }
};

// Answers "does a real account exist for this name".
class AccountDirectory {
public:
    virtual ~AccountDirectory() = default;
    virtual bool account_exists(const std::string& name) const = 0;
};

class PasswdAccountDirectory : public AccountDirectory {
public:
    bool account_exists(const std::string& name) const override;
};

// Lists <home_root>/* and keeps directories whose name is neither denylisted nor orphaned.
class ScopeEnumerator {
public:
    ScopeEnumerator(std::string home_root, std::vector<std::string> skip_accounts, const AccountDirectory& accounts);
    std::vector<ScopeContext> user_scopes() const;
private:
    bool skipped(const std::string& name) const;
    std::string home_root_;
    std::vector<std::string> skip_accounts_;
    const AccountDirectory& accounts_;
};

}
