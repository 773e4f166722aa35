#include <cassert>
#include <random>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#pragma once

class TestException : public std::exception {
    std::string what_msg;

   public:
    TestException(std::string&& what_msg) : what_msg(what_msg) {}
    ~TestException() = default;

    const char* what() const noexcept override { return what_msg.c_str(); }
};

/**
 * Throw with the given message if the condition does not hold.
 */
[[maybe_unused]] static void check(bool cond, std::string&& what_msg) {
    if (!cond) throw TestException(std::move(what_msg));
}

/**
 * Throw if the callable does not throw an exception of type E.
 */
template <typename E, typename Func>
[[maybe_unused]] static void check_throws(Func func, std::string&& what_msg) {
    try {
        func();
    } catch (const E&) {
        return;
    }
    throw TestException(std::move(what_msg));
}

/**
 * Join a vector of keys for mismatch messages.
 */
template <typename T>
[[maybe_unused]] static std::string join_keys(const std::vector<T>& keys) {
    std::string str = "[";
    for (auto&& k : keys) {
        if constexpr (std::is_same_v<T, std::string>)
            str += k;
        else
            str += std::to_string(k);
        str += ",";
    }
    return str + "]";
}

/**
 * Generate random alpha-numerical string.
 */
static constexpr char alphanum[] =
    "0123456789"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz";

thread_local std::uniform_int_distribution<size_t> rand_idx(0,
                                                            sizeof(alphanum) -
                                                                2);

[[maybe_unused]] static std::string gen_rand_string(std::mt19937& gen,
                                                    size_t len) {
    std::string str;
    str.reserve(len);
    for (size_t i = 0; i < len; ++i) str += alphanum[rand_idx(gen)];

    return str;
}
