#pragma once
#include <stdexcept>
#include <string>

namespace ioc_sweep {

// Indicator file could not be loaded or failed validation. Fatal before any scope is touched.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

class IndicatorNotFound : public std::runtime_error {
public:
    explicit IndicatorNotFound(const std::string& id) : std::runtime_error("indicator not found: " + id), id_(id) {}
    const std::string& id() const { return id_; }
private:
    std::string id_;
};

}
