#include "posixc/runtime.hpp"
#include <algorithm>
#include <cstring>

namespace posixc {

const std::vector<RuntimeFunction>& runtime_functions(){
    static const std::vector<RuntimeFunction> table = {
        {"posixc_fs_copy",
         "posixc_fs_copy() {\n"
         "    cp -- \"${1}\" \"${2}\"\n"
         "}\n"},
        {"posixc_fs_exists",
         "posixc_fs_exists() {\n"
         "    if [ -e \"${1}\" ]; then printf '%s\\n' true; else printf '%s\\n' false; fi\n"
         "}\n"},
        {"posixc_fs_is_dir",
         "posixc_fs_is_dir() {\n"
         "    if [ -d \"${1}\" ]; then printf '%s\\n' true; else printf '%s\\n' false; fi\n"
         "}\n"},
        {"posixc_fs_is_file",
         "posixc_fs_is_file() {\n"
         "    if [ -f \"${1}\" ]; then printf '%s\\n' true; else printf '%s\\n' false; fi\n"
         "}\n"},
        {"posixc_fs_mkdir",
         "posixc_fs_mkdir() {\n"
         "    mkdir -p -- \"${1}\"\n"
         "}\n"},
        {"posixc_fs_read_file",
         "posixc_fs_read_file() {\n"
         "    cat -- \"${1}\"\n"
         "}\n"},
        {"posixc_fs_remove",
         "posixc_fs_remove() {\n"
         "    rm -f -- \"${1}\"\n"
         "}\n"},
        {"posixc_fs_write_file",
         "posixc_fs_write_file() {\n"
         "    printf '%s' \"${2}\" >\"${1}\"\n"
         "}\n"},
        {"posixc_require",
         "posixc_require() {\n"
         "    if ! command -v \"${1}\" >/dev/null 2>&1; then\n"
         "        printf '%s\\n' \"posixc: required command not found: ${1}\" >&2\n"
         "        exit 127\n"
         "    fi\n"
         "}\n"},
        {"posixc_string_contains",
         "posixc_string_contains() {\n"
         "    case \"${1}\" in\n"
         "        *\"${2}\"*) printf '%s\\n' true ;;\n"
         "        *) printf '%s\\n' false ;;\n"
         "    esac\n"
         "}\n"},
        {"posixc_string_ends_with",
         "posixc_string_ends_with() {\n"
         "    case \"${1}\" in\n"
         "        *\"${2}\") printf '%s\\n' true ;;\n"
         "        *) printf '%s\\n' false ;;\n"
         "    esac\n"
         "}\n"},
        {"posixc_string_len",
         "posixc_string_len() {\n"
         "    printf '%s\\n' \"${#1}\"\n"
         "}\n"},
        {"posixc_string_replace",
         "posixc_string_replace() {\n"
         "    if [ -z \"${2}\" ]; then\n"
         "        printf '%s\\n' \"${1}\"\n"
         "        return 0\n"
         "    fi\n"
         "    posixc_rest=\"${1}\"\n"
         "    posixc_out=''\n"
         "    while :; do\n"
         "        case \"${posixc_rest}\" in\n"
         "            *\"${2}\"*)\n"
         "                posixc_head=\"${posixc_rest%%\"${2}\"*}\"\n"
         "                posixc_out=\"${posixc_out}${posixc_head}${3}\"\n"
         "                posixc_rest=\"${posixc_rest#*\"${2}\"}\"\n"
         "                ;;\n"
         "            *)\n"
         "                printf '%s\\n' \"${posixc_out}${posixc_rest}\"\n"
         "                return 0\n"
         "                ;;\n"
         "        esac\n"
         "    done\n"
         "}\n"},
        {"posixc_string_starts_with",
         "posixc_string_starts_with() {\n"
         "    case \"${1}\" in\n"
         "        \"${2}\"*) printf '%s\\n' true ;;\n"
         "        *) printf '%s\\n' false ;;\n"
         "    esac\n"
         "}\n"},
        {"posixc_string_to_lower",
         "posixc_string_to_lower() {\n"
         "    printf '%s\\n' \"${1}\" | tr '[:upper:]' '[:lower:]'\n"
         "}\n"},
        {"posixc_string_to_upper",
         "posixc_string_to_upper() {\n"
         "    printf '%s\\n' \"${1}\" | tr '[:lower:]' '[:upper:]'\n"
         "}\n"},
        {"posixc_string_trim",
         "posixc_string_trim() {\n"
         "    posixc_ws=\"$(printf ' \\t\\n\\r\\v\\f.')\"\n"
         "    posixc_ws=\"${posixc_ws%.}\"\n"
         "    posixc_s=\"${1}\"\n"
         "    while [ -n \"${posixc_s}\" ]; do\n"
         "        posixc_c=\"${posixc_s%\"${posixc_s#?}\"}\"\n"
         "        case \"${posixc_ws}\" in\n"
         "            *\"${posixc_c}\"*) posixc_s=\"${posixc_s#?}\" ;;\n"
         "            *) break ;;\n"
         "        esac\n"
         "    done\n"
         "    while [ -n \"${posixc_s}\" ]; do\n"
         "        posixc_c=\"${posixc_s#\"${posixc_s%?}\"}\"\n"
         "        case \"${posixc_ws}\" in\n"
         "            *\"${posixc_c}\"*) posixc_s=\"${posixc_s%?}\" ;;\n"
         "            *) break ;;\n"
         "        esac\n"
         "    done\n"
         "    printf '%s\\n' \"${posixc_s}\"\n"
         "}\n"},
    };
    return table;
}

const RuntimeFunction* find_runtime(const std::string& name){
    const auto& table = runtime_functions();
    auto it = std::lower_bound(table.begin(), table.end(), name,
        [](const RuntimeFunction& f, const std::string& n){ return std::strcmp(f.name, n.c_str()) < 0; });
    if(it == table.end() || name != it->name) return nullptr;
    return &*it;
}

} // namespace posixc
