#include "test_env.hpp"
#include <cstdlib>

void set_env(const std::string& name, const std::string& value)
{
    ::setenv(name.c_str(), value.c_str(), 1);
}

void unset_env(const std::string& name)
{
    ::unsetenv(name.c_str());
}

ScopedEnv::ScopedEnv(std::string name, const std::string& value) : name_(std::move(name))
{
    if(const char* v = std::getenv(name_.c_str())){
        had_ = true;
        old_ = v;
    }
    set_env(name_, value);
}

ScopedEnv::~ScopedEnv()
{
    if(had_) set_env(name_, old_);
    else unset_env(name_);
}
