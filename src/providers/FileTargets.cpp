#include "FileTargets.h"
#include <glob.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <sys/ioctl.h>
#include <linux/fs.h>
#include "../core/Utils.h"
#ifdef IOC_SWEEP_HAVE_OPENSSL
#include <openssl/evp.h>
#endif

namespace ioc_sweep {

std::string anchor_path(const std::string& pattern, const ScopeContext& scope){
    std::string base = scope.kind == ScopeKind::PerUser ? scope.home : "";
    if(pattern.rfind("~/", 0) == 0) return base + pattern.substr(1);
    if(!pattern.empty() && pattern[0] == '/') return pattern;
    return base + "/" + pattern;
}

static bool has_glob_chars(const std::string& s){
    return s.find_first_of("*?[") != std::string::npos;
}

TargetResolution resolve_targets(const std::string& pattern, const ScopeContext& scope){
    TargetResolution res;
    std::string anchored = anchor_path(pattern, scope);
    if(!has_glob_chars(anchored)){
        struct stat st{};
        if(lstat(anchored.c_str(), &st) == 0) res.paths.push_back(anchored);
        return res;
    }
    glob_t g{};
    int rc = glob(anchored.c_str(), GLOB_NOSORT, nullptr, &g);
    if(rc == 0){
        for(size_t i = 0; i < g.gl_pathc; ++i) res.paths.emplace_back(g.gl_pathv[i]);
    } else if(rc == GLOB_ABORTED){
        res.failed = true;
        res.error = "read error while expanding " + anchored;
    } else if(rc == GLOB_NOSPACE){
        res.failed = true;
        res.error = "out of memory while expanding " + anchored;
    }
    globfree(&g);
    std::sort(res.paths.begin(), res.paths.end());
    return res;
}

std::optional<bool> read_immutable_flag(const std::string& path, std::string* error){
    int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if(fd == -1){
        if(error) *error = utils::errno_text(errno);
        return std::nullopt;
    }
    int flags = 0;
    if(ioctl(fd, FS_IOC_GETFLAGS, &flags) == -1){
        if(error) *error = utils::errno_text(errno);
        close(fd);
        return std::nullopt;
    }
    close(fd);
    return (flags & FS_IMMUTABLE_FL) != 0;
}

bool sha256_available(){
#ifdef IOC_SWEEP_HAVE_OPENSSL
    return true;
#else
    return false;
#endif
}

std::string sha256_file(const std::string& path){
#ifdef IOC_SWEEP_HAVE_OPENSSL
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if(fd == -1) return "";
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if(!ctx){ close(fd); return ""; }
    if(EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1){
        EVP_MD_CTX_free(ctx); close(fd); return "";
    }
    unsigned char buf[8192];
    ssize_t n;
    bool ok = true;
    while((n = read(fd, buf, sizeof(buf))) > 0){
        if(EVP_DigestUpdate(ctx, buf, static_cast<size_t>(n)) != 1){ ok = false; break; }
    }
    if(n < 0) ok = false;
    close(fd);
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdlen = 0;
    if(!ok || EVP_DigestFinal_ex(ctx, md, &mdlen) != 1){ EVP_MD_CTX_free(ctx); return ""; }
    EVP_MD_CTX_free(ctx);
    static const char* hx = "0123456789abcdef";
    std::string hex;
    for(unsigned i = 0; i < mdlen; ++i){ hex.push_back(hx[md[i] >> 4]); hex.push_back(hx[md[i] & 0xF]); }
    return hex;
#else
    (void)path;
    return "";
#endif
}

}
