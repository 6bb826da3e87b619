#include "test_env.hpp"
#include <cstdlib>
#include <cstring>
#include <string>

#if !defined(_WIN32)
extern "C" int _putenv(const char* assignment){
    const char* eq = assignment ? std::strchr(assignment, '=') : nullptr;
    if(!eq || eq == assignment) return -1;
    const std::string name(assignment, (size_t)(eq - assignment));
    if(eq[1] == '\0') return ::unsetenv(name.c_str());
    return ::setenv(name.c_str(), eq + 1, 1);
}
#endif
