#pragma once

#include <string>

// Test-only environment setter. Windows has _putenv_s, POSIX has setenv/unsetenv.
namespace wikitext_test {

// Set NAME to VALUE; a null VALUE removes the variable.
int set_env(const char* name, const char* value);

// Restores the previous value of a variable when it goes out of scope.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    const char* name_;
    bool had_ = false;
    std::string saved_;
};

} // namespace wikitext_test
