#pragma once

// Tests toggle DYNQ_* switches with _putenv("NAME=VALUE"); an empty value
// clears the variable. POSIX builds get the definition from test_env.cpp.

#ifndef _WIN32
extern "C" int _putenv(const char* assignment);
#endif
