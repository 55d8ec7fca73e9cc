#pragma once
#include <cstdlib>

namespace posixc {
inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}
// Explicit opt-out for options that default to on.
inline bool flag_disabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='0' || *v=='f' || *v=='F' || *v=='n' || *v=='N';
}
inline bool debug_parse(){ return flag_enabled("POSIXC_DEBUG_PARSE"); }
inline bool debug_lower(){ return flag_enabled("POSIXC_DEBUG_LOWER"); }
inline bool debug_opt(){ return flag_enabled("POSIXC_DEBUG_OPT"); }
inline bool debug_emit(){ return flag_enabled("POSIXC_DEBUG_EMIT"); }
inline bool debug_validate(){ return flag_enabled("POSIXC_DEBUG_VALIDATE"); }
} // namespace posixc
