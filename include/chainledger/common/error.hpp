#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace chainledger {

    // ===========================================
    // Chainledger-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_VALIDATION = 100;
    constexpr dp::u32 ERR_DUPLICATE_RECORD = 101;
    constexpr dp::u32 ERR_SCOPE_NOT_FOUND = 102;
    constexpr dp::u32 ERR_STORAGE = 103;
    constexpr dp::u32 ERR_NOT_INITIALIZED = 104;
    constexpr dp::u32 ERR_HASH_FAILED = 105;
    constexpr dp::u32 ERR_SERIALIZATION_FAILED = 106;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error validation_error(const std::string &msg = "Invalid record payload") {
        return dp::Error{ERR_VALIDATION, dp::String(msg.c_str())};
    }

    inline dp::Error duplicate_record(const std::string &msg = "Record already exists") {
        return dp::Error{ERR_DUPLICATE_RECORD, dp::String(msg.c_str())};
    }

    inline dp::Error scope_not_found(const std::string &msg = "Chain scope not found") {
        return dp::Error{ERR_SCOPE_NOT_FOUND, dp::String(msg.c_str())};
    }

    inline dp::Error storage_error(const std::string &msg = "Storage operation failed") {
        return dp::Error{ERR_STORAGE, dp::String(msg.c_str())};
    }

    inline dp::Error not_initialized(const std::string &msg = "Not initialized") {
        return dp::Error{ERR_NOT_INITIALIZED, dp::String(msg.c_str())};
    }

    inline dp::Error hash_failed(const std::string &msg = "Hash computation failed") {
        return dp::Error{ERR_HASH_FAILED, dp::String(msg.c_str())};
    }

    inline dp::Error serialization_failed(const std::string &msg = "Serialization failed") {
        return dp::Error{ERR_SERIALIZATION_FAILED, dp::String(msg.c_str())};
    }

} // namespace chainledger
