#include "posixc/mangle.hpp"
#include <set>

namespace posixc {

static const std::set<std::string>& reserved_table(){
    static const std::set<std::string> table = {
        // reserved words
        "!", "case", "do", "done", "elif", "else", "esac", "fi", "for", "function", "if", "in",
        "select", "then", "time", "until", "while",
        // special builtins
        "break", "continue", "eval", "exec", "exit", "export", "readonly", "return",
        "set", "shift", "times", "trap", "unset",
        // builtins and utilities referenced by generated code
        "alias", "cat", "cd", "command", "cp", "echo", "false", "getopts", "hash", "kill",
        "local", "mkdir", "printf", "read", "rm", "sed", "seq", "source", "test",
        "tr", "true", "type", "ulimit", "umask", "unalias", "wait",
        // names other shells treat as commands
        "declare", "let", "popd", "pushd", "shopt", "typeset",
        // special and sensitive variables
        "_", "CDPATH", "ENV", "FCEDIT", "HISTFILE", "HISTSIZE", "HOME", "IFS", "LANG", "LINENO",
        "MAIL", "MAILCHECK", "MAILPATH", "NLSPATH", "OLDPWD", "OPTARG", "OPTIND", "PATH",
        "POSIXLY_CORRECT", "PPID", "PS1", "PS2", "PS3", "PS4", "PWD", "RANDOM", "SECONDS",
        "SHELL", "TERM", "TMOUT", "TMPDIR", "TZ",
    };
    return table;
}

static bool starts_with(const std::string& s, const char* prefix){
    return s.rfind(prefix, 0) == 0;
}

bool needs_mangling(const std::string& name){
    if(starts_with(name, kManglePrefix) || starts_with(name, kRuntimePrefix)) return true;
    // every locale category, including ones added after POSIX.1-2017
    if(starts_with(name, "BASH") || starts_with(name, "LC_")) return true;
    return reserved_table().count(name) != 0;
}

std::string mangle(const std::string& name){
    if(!needs_mangling(name)) return name;
    return std::string(kManglePrefix) + name;
}

} // namespace posixc
