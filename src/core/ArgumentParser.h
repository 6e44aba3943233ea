#pragma once
#include "Config.h"
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace ioc_sweep {

class ArgumentParser {
public:
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* help;
        std::function<void(Config&, const std::string&)> apply;
    };

    ArgumentParser();

    // Returns false when the program should stop: --help / --version (exit_code() 0)
    // or a usage error (exit_code() 2, error() set).
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }
    const std::string& error() const { return error_; }

    void print_help(std::ostream& os) const;
    static void print_version(std::ostream& os);

private:
    const FlagSpec* find(const std::string& flag) const;
    bool fail(const std::string& message);

    std::vector<FlagSpec> specs_;
    std::string error_;
    int exit_code_ = 0;
};

}
