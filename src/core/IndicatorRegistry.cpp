#include "IndicatorRegistry.h"
#include "Errors.h"
#include "Config.h"
#include "Logging.h"
#include "Utils.h"
#include <nlohmann/json.hpp>
#include <regex>

using nlohmann::json;

namespace ioc_sweep {
namespace {

constexpr int kSupportedVersion = 1;

[[noreturn]] void fail(const std::string& origin, const std::string& id, const std::string& msg){
    std::string where = origin;
    if(!id.empty()) where += ": indicator '" + id + "'";
    throw ConfigError(where + ": " + msg);
}

std::string scalar_text(const json& v){
    if(v.is_string()) return v.get<std::string>();
    if(v.is_boolean()) return v.get<bool>() ? "true" : "false";
    return v.dump();
}

std::vector<std::string> string_list(const json& v, const std::string& origin, const std::string& id, const std::string& field){
    if(!v.is_array()) fail(origin, id, "'" + field + "' must be an array of strings");
    std::vector<std::string> out;
    for(const auto& e : v){
        if(!e.is_string()) fail(origin, id, "'" + field + "' must contain only strings");
        out.push_back(e.get<std::string>());
    }
    return out;
}

ProviderArgs parse_args(const json& j, const std::string& origin, const std::string& id){
    ProviderArgs args;
    if(j.is_null()) return args;
    if(!j.is_object()) fail(origin, id, "'args' must be an object");
    for(auto it = j.begin(); it != j.end(); ++it){
        const auto& v = it.value();
        if(v.is_array()) args.set_list(it.key(), string_list(v, origin, id, "args." + it.key()));
        else if(v.is_string() || v.is_number() || v.is_boolean()) args.set(it.key(), scalar_text(v));
        else fail(origin, id, "unsupported value for args." + it.key());
    }
    return args;
}

// Accepts "must_not_exist" or {"type": ..., "value"/"values": ..., "missing": ...}
Expectation parse_expectation(const json& j, const std::string& origin, const std::string& id){
    Expectation e;
    if(j.is_null()) return e;
    std::string type;
    if(j.is_string()) type = j.get<std::string>();
    else if(j.is_object() && j.contains("type") && j["type"].is_string()) type = j["type"].get<std::string>();
    else fail(origin, id, "'expect' must be a string or an object with a 'type'");
    auto kind = parse_expectation_kind(type);
    if(!kind) fail(origin, id, "unknown expectation type '" + type + "'");
    e.kind = *kind;
    if(e.kind == ExpectationKind::MustNotExist) return e;
    if(!j.is_object()) fail(origin, id, std::string(to_string(e.kind)) + " requires a value");
    if(j.contains("values")){
        e.values = string_list(j["values"], origin, id, "expect.values");
        e.set_equality = e.kind == ExpectationKind::MustEqual;
    } else if(j.contains("value")){
        if(j["value"].is_array() || j["value"].is_object()) fail(origin, id, "'expect.value' must be a scalar");
        e.values.push_back(scalar_text(j["value"]));
    }
    if(e.values.empty()) fail(origin, id, std::string(to_string(e.kind)) + " requires a non-empty value");
    if(j.contains("missing")){
        std::string missing = j["missing"].is_string() ? j["missing"].get<std::string>() : "";
        if(missing == "violation") e.missing_is_violation = true;
        else if(missing == "clean") e.missing_is_violation = false;
        else fail(origin, id, "'expect.missing' must be 'violation' or 'clean'");
    }
    return e;
}

Remediation parse_remediation(const json& j, const std::string& origin, const std::string& id){
    Remediation r;
    if(j.is_null()) return r;
    std::string type;
    if(j.is_string()) type = j.get<std::string>();
    else if(j.is_object() && j.contains("type") && j["type"].is_string()) type = j["type"].get<std::string>();
    else fail(origin, id, "'remediation' must be a string or an object with a 'type'");
    auto kind = parse_remediation_kind(type);
    if(!kind) fail(origin, id, "unknown remediation type '" + type + "'");
    r.kind = *kind;
    if(!j.is_object()) {
        if(r.kind == RemediationKind::ResetPreference) fail(origin, id, "reset_preference requires a value");
        if(r.kind == RemediationKind::RestorePermissions) fail(origin, id, "restore_permissions requires a mode");
        return r;
    }
    if(j.contains("recursive")){
        if(!j["recursive"].is_boolean()) fail(origin, id, "'remediation.recursive' must be a boolean");
        r.recursive = j["recursive"].get<bool>();
    }
    if(r.kind == RemediationKind::ResetPreference){
        if(j.contains("values")){
            r.values = string_list(j["values"], origin, id, "remediation.values");
            r.write_array = true;
        } else if(j.contains("value") && !j["value"].is_array() && !j["value"].is_object()){
            r.values.push_back(scalar_text(j["value"]));
        } else {
            fail(origin, id, "reset_preference requires 'value' or 'values'");
        }
    }
    if(r.kind == RemediationKind::RestorePermissions){
        std::string mode = j.contains("mode") ? scalar_text(j["mode"]) : "";
        if(!utils::parse_mode(mode, r.mode)) fail(origin, id, "restore_permissions requires an octal 'mode' (e.g. \"0600\")");
    }
    return r;
}

void require_arg(const IndicatorDefinition& def, const std::string& key, const std::string& origin){
    if(def.args.get(key).empty()) fail(origin, def.id, std::string(to_string(def.provider)) + " requires args." + key);
}

void check_regex(const IndicatorDefinition& def, const std::vector<std::string>& patterns, const std::string& origin){
    if(!def.args.get_bool("regex")) return;
    for(const auto& p : patterns){
        try { std::regex re(p); }
        catch(const std::regex_error& ex){ fail(origin, def.id, "invalid regex '" + p + "': " + ex.what()); }
    }
}

void validate(const IndicatorDefinition& def, const std::string& origin){
    switch(def.provider){
        case ProviderKind::ProcessPattern:
            require_arg(def, "pattern", origin);
            check_regex(def, {def.args.get("pattern")}, origin);
            break;
        case ProviderKind::FileExistence: {
            require_arg(def, "path", origin);
            std::string attr = def.args.get("attribute", "path");
            if(attr!="path" && attr!="mode" && attr!="immutable" && attr!="sha256")
                fail(origin, def.id, "unknown file attribute '" + attr + "'");
            std::string type = def.args.get("type", "any");
            if(type!="any" && type!="file" && type!="directory")
                fail(origin, def.id, "args.type must be any, file or directory");
            break;
        }
        case ProviderKind::FileContentPattern:
            require_arg(def, "path", origin);
            require_arg(def, "pattern", origin);
            check_regex(def, {def.args.get("pattern")}, origin);
            break;
        case ProviderKind::PreferenceKey:
            require_arg(def, "domain", origin);
            require_arg(def, "key", origin);
            if(def.args.get("domain").find('/') != std::string::npos)
                fail(origin, def.id, "preference domain must not contain '/'");
            break;
        case ProviderKind::LogPattern: {
            auto patterns = def.args.get_list("patterns");
            if(patterns.empty() && !def.args.get("pattern").empty()) patterns.push_back(def.args.get("pattern"));
            if(patterns.empty()) fail(origin, def.id, "log_pattern requires args.pattern or args.patterns");
            check_regex(def, patterns, origin);
            if(def.args.get_long("window", 86400) <= 0) fail(origin, def.id, "args.window must be a positive number of seconds");
            break;
        }
    }
    if(!remediation_compatible(def.remediation.kind, def.provider)){
        fail(origin, def.id, std::string("remediation ") + to_string(def.remediation.kind) +
             " cannot act on " + to_string(def.provider) + " evidence");
    }
    if(def.expectation.kind != ExpectationKind::MustNotExist &&
       (def.provider == ProviderKind::ProcessPattern || def.provider == ProviderKind::LogPattern)){
        fail(origin, def.id, std::string(to_string(def.expectation.kind)) + " is not meaningful for " + to_string(def.provider));
    }
    if(severity_rank(def.severity) < 0) fail(origin, def.id, "unknown severity '" + def.severity + "'");
}

}

void IndicatorRegistry::add(IndicatorDefinition def, const std::string& origin){
    if(index_.count(def.id)) fail(origin, def.id, "duplicate indicator id");
    index_.emplace(def.id, indicators_.size());
    indicators_.push_back(std::move(def));
}

IndicatorRegistry IndicatorRegistry::load(const std::string& path){
    auto text = utils::read_file(path, 16 << 20);
    if(!text) throw ConfigError("cannot read indicator file: " + path);
    return load_from_string(*text, path);
}

IndicatorRegistry IndicatorRegistry::load_from_string(const std::string& text, const std::string& origin){
    json doc;
    try {
        doc = json::parse(text);
    } catch(const json::parse_error& ex){
        throw ConfigError(origin + ": malformed JSON: " + ex.what());
    }
    if(!doc.is_object()) throw ConfigError(origin + ": top level must be an object");
    if(doc.contains("version")){
        if(!doc["version"].is_number_integer() || doc["version"].get<int>() != kSupportedVersion)
            throw ConfigError(origin + ": unsupported indicator file version " + doc["version"].dump());
    }
    if(!doc.contains("indicators") || !doc["indicators"].is_array())
        throw ConfigError(origin + ": 'indicators' array missing");

    IndicatorRegistry reg;
    size_t pos = 0;
    try {
        for(const auto& entry : doc["indicators"]){
            ++pos;
            if(!entry.is_object()) fail(origin, "", "entry #" + std::to_string(pos) + " is not an object");
            IndicatorDefinition def;
            if(!entry.contains("id") || !entry["id"].is_string() || utils::trim(entry["id"].get<std::string>()).empty())
                fail(origin, "", "entry #" + std::to_string(pos) + " has no id");
            def.id = entry["id"].get<std::string>();
            if(entry.contains("description") && entry["description"].is_string()) def.description = entry["description"].get<std::string>();
            if(entry.contains("severity")){
                if(!entry["severity"].is_string()) fail(origin, def.id, "'severity' must be a string");
                def.severity = utils::to_lower(entry["severity"].get<std::string>());
            }

            std::string scope = entry.contains("scope") && entry["scope"].is_string() ? entry["scope"].get<std::string>() : "system";
            auto sk = parse_scope_kind(scope);
            if(!sk) fail(origin, def.id, "unknown scope '" + scope + "'");
            def.scope = *sk;

            if(!entry.contains("provider") || !entry["provider"].is_string()) fail(origin, def.id, "'provider' missing");
            std::string provider = entry["provider"].get<std::string>();
            auto pk = parse_provider_kind(provider);
            if(!pk) fail(origin, def.id, "unknown provider kind '" + provider + "'");
            def.provider = *pk;

            def.args = parse_args(entry.contains("args") ? entry["args"] : json(), origin, def.id);
            def.expectation = parse_expectation(entry.contains("expect") ? entry["expect"] : json(), origin, def.id);
            def.remediation = parse_remediation(entry.contains("remediation") ? entry["remediation"] : json(), origin, def.id);

            validate(def, origin);
            reg.add(std::move(def), origin);
        }
    } catch(const json::exception& ex){
        throw ConfigError(origin + ": entry #" + std::to_string(pos) + ": " + ex.what());
    }
    Logger::instance().debug("Loaded " + std::to_string(reg.size()) + " indicators from " + origin);
    return reg;
}

const IndicatorDefinition& IndicatorRegistry::lookup(const std::string& id) const {
    auto it = index_.find(id);
    if(it == index_.end()) throw IndicatorNotFound(id);
    return indicators_[it->second];
}

json indicator_to_json(const IndicatorDefinition& def){
    json j;
    j["id"] = def.id;
    if(!def.description.empty()) j["description"] = def.description;
    j["severity"] = def.severity;
    j["scope"] = to_string(def.scope);
    j["provider"] = to_string(def.provider);
    json args = json::object();
    for(const auto& kv : def.args.all()){
        if(kv.second.size() == 1) args[kv.first] = kv.second.front();
        else args[kv.first] = kv.second;
    }
    j["args"] = args;

    const auto& e = def.expectation;
    json expect = {{"type", to_string(e.kind)}};
    if(e.kind != ExpectationKind::MustNotExist){
        if(e.kind == ExpectationKind::MustEqual && !e.set_equality && e.values.size() == 1) expect["value"] = e.values.front();
        else expect["values"] = e.values;
        expect["missing"] = e.missing_is_violation ? "violation" : "clean";
    }
    j["expect"] = expect;

    const auto& r = def.remediation;
    json rem = {{"type", to_string(r.kind)}};
    switch(r.kind){
        case RemediationKind::ResetPreference:
            if(r.write_array) rem["values"] = r.values;
            else if(!r.values.empty()) rem["value"] = r.values.front();
            break;
        case RemediationKind::RestorePermissions:
            rem["mode"] = utils::format_mode(r.mode);
            rem["recursive"] = r.recursive;
            break;
        case RemediationKind::Delete:
            rem["recursive"] = r.recursive;
            break;
        default:
            break;
    }
    j["remediation"] = rem;
    return j;
}

}
