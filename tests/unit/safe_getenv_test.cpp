#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <string>
#include <cstdlib>
#include "sqvec/core/platform_utils.hpp"

using sqvec::core::safe_getenv;
using sqvec::core::env_flag;

static void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
    _putenv_s(name, value ? value : "");
#else
    if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

TEST_CASE("safe_getenv returns nullopt when unset", "[platform][env]") {
    const char* key = "SQVEC_TEST_SAFE_GETENV_UNSET";
    set_env_var(key, nullptr);
    REQUIRE_FALSE(safe_getenv(key).has_value());
    REQUIRE_FALSE(safe_getenv(nullptr).has_value());
    REQUIRE_FALSE(safe_getenv("").has_value());
}

TEST_CASE("safe_getenv returns value when set", "[platform][env]") {
    const char* key = "SQVEC_TEST_SAFE_GETENV_VALUE";
    set_env_var(key, "hello_world");
    auto v = safe_getenv(key);
    REQUIRE(v.has_value());
    REQUIRE(*v == "hello_world");
    set_env_var(key, nullptr);
}

TEST_CASE("env_flag treats unset, empty and 0-prefixed values as off", "[platform][env]") {
    const char* key = "SQVEC_TEST_ENV_FLAG";
    set_env_var(key, nullptr);
    REQUIRE_FALSE(env_flag(key));
#if !defined(_WIN32)
    set_env_var(key, "");
    REQUIRE_FALSE(env_flag(key));
#endif
    set_env_var(key, "0");
    REQUIRE_FALSE(env_flag(key));
    set_env_var(key, "1");
    REQUIRE(env_flag(key));
    set_env_var(key, "yes");
    REQUIRE(env_flag(key));
    set_env_var(key, nullptr);
}
