#include "ProviderSet.h"
#include "Config.h"
#include "Logging.h"
#include "../providers/ProcessPatternProvider.h"
#include "../providers/FileExistenceProvider.h"
#include "../providers/FileContentPatternProvider.h"
#include "../providers/PreferenceKeyProvider.h"
#include "../providers/LogPatternProvider.h"

namespace ioc_sweep {

void ProviderSet::register_provider(EvidenceProviderPtr provider){
    ProviderKind k = provider->kind();
    Logger::instance().trace("Registering provider: " + provider->name());
    providers_[k] = std::move(provider);
}

void ProviderSet::register_all_default(const Config& cfg, ProcessTable& processes, PreferenceStore& prefs, LogSource& logs){
    register_provider(std::make_unique<ProcessPatternProvider>(processes));
    register_provider(std::make_unique<FileExistenceProvider>());
    register_provider(std::make_unique<FileContentPatternProvider>());
    register_provider(std::make_unique<PreferenceKeyProvider>(prefs));
    register_provider(std::make_unique<LogPatternProvider>(logs, cfg.provider_timeout_ms, cfg.log_sample_limit));
}

EvidenceProvider* ProviderSet::find(ProviderKind kind) const {
    auto it = providers_.find(kind);
    return it == providers_.end() ? nullptr : it->second.get();
}

}
