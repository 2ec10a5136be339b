#pragma once

#include <string>
#include <optional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct GithubConfig {
    std::string owner;
    std::string repo;
    std::string api_base;
};

struct HttpConfig {
    int timeout = 60;                 // whole-request limit, seconds
    int connect_timeout = 15;
    std::string user_agent;
};

struct InitDefaults {
    std::string ai;                   // agent key used when --ai is omitted
    std::string script = "sh";        // "sh" or "ps"
};

struct DisplayConfig {
    int refresh_ms = 80;              // minimum gap between live redraws
};

