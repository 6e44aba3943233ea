#include "Config.h"
#include "Utils.h"

namespace ioc_sweep {
static Config global_cfg;
Config& config(){ return global_cfg; }
void set_config(const Config& c){ global_cfg = c; }

int severity_rank(const std::string& sev){
    std::string s = utils::to_lower(sev);
    if(s=="info") return 0;
    if(s=="low") return 1;
    if(s=="medium") return 2;
    if(s=="high") return 3;
    if(s=="critical") return 4;
    return -1;
}
}
