// Common helper classes and functions.

#include <syscall.h>
#include <unistd.h>

#include <cctype>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#pragma once

namespace lexitree {

/** Universal exception type. */
class LexitreeException : public std::exception {
    std::string what_msg;

   public:
    LexitreeException(std::string&& what_msg)
        : what_msg("LexitreeException: " + what_msg) {}
    ~LexitreeException() = default;

    const char* what() const noexcept override { return what_msg.c_str(); }
};

/**
 * Raised when a key breaks the comparator contract, e.g. compares less than
 * itself. This is a programming error and is never retried.
 */
class ComparatorViolation : public LexitreeException {
   public:
    ComparatorViolation(std::string&& what_msg)
        : LexitreeException("comparator violation: " + what_msg) {}
    ~ComparatorViolation() = default;
};

/** Debug printing utilities. */
// thread ID
extern thread_local const pid_t tid;

// get std::string representation of any variable that has operator<<
template <typename T>
static inline std::string StreamStr(const T& item) {
    std::ostringstream ss;
    ss << item;
    return ss.str();
}

// strip leading and trailing whitespace, including a CRLF's '\r'
static inline std::string TrimSpace(const std::string& str) {
    size_t spos = 0, epos = str.length();
    while (spos < epos && std::isspace(static_cast<unsigned char>(str[spos])))
        spos++;
    while (epos > spos &&
           std::isspace(static_cast<unsigned char>(str[epos - 1])))
        epos--;
    return str.substr(spos, epos - spos);
}

// `DEBUG()` and `assert()` are not active if NDEBUG is defined at
// compilation time by the build system.
#ifdef NDEBUG
#define DEBUG(msg, ...)
#else
#define DEBUG(msg, ...)                                                       \
    do {                                                                      \
        const char* tmp = strrchr(__FILE__, '/');                             \
        const char* file = tmp ? tmp + 1 : __FILE__;                          \
        fprintf(stderr, "[%20s:%-4d@t:%-6d]  " msg "\n", file, __LINE__, tid, \
                ##__VA_ARGS__);                                               \
    } while (0)
#endif

}  // namespace lexitree
