#include "posixc/config.hpp"
#include "posixc/features.hpp"
#include <cstdlib>
#include <cstdio>

namespace posixc {

static void read_bool(const char* name, bool& field){
    if(flag_enabled(name)) field = true;
    else if(flag_disabled(name)) field = false;
}

static void read_unsigned(const char* name, unsigned long& field){
    const char* v = std::getenv(name);
    if(!v || !*v) return;
    char* end=nullptr;
    unsigned long n = std::strtoul(v, &end, 10);
    if(end && *end=='\0') field = n;
    else if(debug_validate()) std::fprintf(stderr, "[dbg][config] ignoring non-numeric %s=%s\n", name, v);
}

Config detect_config(){
    Config c;
    read_bool("POSIXC_STRICT", c.strict_mode);
    read_bool("POSIXC_DCE", c.enable_dead_code_elimination);
    read_bool("POSIXC_CONST_FOLD", c.enable_constant_folding);
    read_bool("POSIXC_INLINE", c.enable_inlining);
    read_bool("POSIXC_VERIFY_DETERMINISM", c.verify_determinism);
    unsigned long threshold = c.inline_branch_threshold;
    read_unsigned("POSIXC_INLINE_THRESHOLD", threshold);
    c.inline_branch_threshold = static_cast<unsigned>(threshold);
    unsigned long maxd = c.max_diagnostics;
    read_unsigned("POSIXC_MAX_DIAGNOSTICS", maxd);
    c.max_diagnostics = maxd ? static_cast<size_t>(maxd) : 1;
    if(const char* a = std::getenv("POSIXC_ANALYZER"); a && *a){
        c.analyzer.enabled = true;
        c.analyzer.program = a;
    }
    if(const char* s = std::getenv("POSIXC_ANALYZER_SEVERITY"); s && *s) c.analyzer.severity = s;
    unsigned long timeout = c.analyzer.timeout_seconds;
    read_unsigned("POSIXC_ANALYZER_TIMEOUT", timeout);
    c.analyzer.timeout_seconds = static_cast<unsigned>(timeout);
    return c;
}

} // namespace posixc
