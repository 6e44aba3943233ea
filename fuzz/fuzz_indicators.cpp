#include "core/IndicatorRegistry.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include <cstddef>
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    ioc_sweep::Logger::instance().set_level(ioc_sweep::LogLevel::Error);
    std::string input(reinterpret_cast<const char*>(data), size);
    try {
        auto registry = ioc_sweep::IndicatorRegistry::load_from_string(input, "<fuzz>");
        for(const auto& def : registry.indicators()){
            // every accepted definition must survive a round trip through its JSON form
            nlohmann::json doc = {{"version", 1}, {"indicators", nlohmann::json::array({ioc_sweep::indicator_to_json(def)})}};
            ioc_sweep::IndicatorRegistry::load_from_string(doc.dump(), "<fuzz-roundtrip>");
        }
    } catch(const ioc_sweep::ConfigError&) {
        // rejected input
    }
    return 0;
}
