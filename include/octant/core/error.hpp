#pragma once

/// @file error.hpp
/// @brief Error handling types for octant_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>

namespace octant_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// Coarse category shared by every error kind
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    IOError,
    ParseError,
    ValidationError,
};

[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Spatial index errors
struct SpatialError {
    enum class Kind : std::uint8_t {
        DuplicateEntity,  // Entity ID already indexed
        EntityNotFound,   // Entity ID not indexed
        InvalidBounds,    // Inverted or non-finite bounding box
    };

    Kind kind;
    std::string message;
    std::string entity;  // Formatted entity ID

    [[nodiscard]] static SpatialError duplicate_entity(const std::string& id) {
        return SpatialError{Kind::DuplicateEntity, "Entity already indexed: " + id, id};
    }

    [[nodiscard]] static SpatialError entity_not_found(const std::string& id) {
        return SpatialError{Kind::EntityNotFound, "Entity not found: " + id, id};
    }

    [[nodiscard]] static SpatialError invalid_bounds(const std::string& id, const std::string& reason) {
        return SpatialError{Kind::InvalidBounds, "Entity '" + id + "' has invalid bounds: " + reason, id};
    }
};

/// Configuration loading errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        IOError,       // File could not be read
        ParseError,    // Malformed document
        InvalidValue,  // Key present but value rejected
    };

    Kind kind;
    std::string message;
    std::string source;  // File name or source label
    std::string key;     // For InvalidValue

    [[nodiscard]] static ConfigError io_error(const std::string& path) {
        return ConfigError{Kind::IOError, "Failed to open config file: " + path, path, {}};
    }

    [[nodiscard]] static ConfigError parse_error(const std::string& src, const std::string& reason) {
        return ConfigError{Kind::ParseError, "Config parse error: " + reason, src, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key_name, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key_name + "': " + reason, {}, key_name};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Any octant failure: one kind struct or a free-form message, plus
/// key/value context added while the error travels up
class Error {
public:
    using Variant = std::variant<
        SpatialError,
        ConfigError,
        std::string  // Generic message
    >;

    Error(SpatialError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(std::string msg) : m_code(ErrorCode::Unknown), m_error(std::move(msg)) {}
    Error(const char* msg) : Error(std::string(msg)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Kind message, or the free-form text
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Kind struct if this error holds a T, otherwise nullptr
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Attach a key/value pair, e.g. the TOML source a config error came from
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// nullptr when the key was never attached
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(SpatialError::Kind kind) {
        switch (kind) {
            case SpatialError::Kind::DuplicateEntity: return ErrorCode::AlreadyExists;
            case SpatialError::Kind::EntityNotFound: return ErrorCode::NotFound;
            case SpatialError::Kind::InvalidBounds: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::IOError: return ErrorCode::IOError;
            case ConfigError::Kind::ParseError: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::ValidationError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Either a value or an error. Accessing the wrong alternative is undefined.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_state(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_state.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return *std::get_if<0>(&m_state); }
    [[nodiscard]] const T& value() const& { return *std::get_if<0>(&m_state); }
    [[nodiscard]] T&& value() && { return std::move(*std::get_if<0>(&m_state)); }

    [[nodiscard]] E& error() & { return *std::get_if<1>(&m_state); }
    [[nodiscard]] const E& error() const& { return *std::get_if<1>(&m_state); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

private:
    std::variant<T, E> m_state;
};

/// Success carries nothing; failure carries E
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }

private:
    std::optional<E> m_error;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Formatting
// =============================================================================

/// Build a full error message with code, kind details and context
std::string build_error_chain(const Error& error);

} // namespace octant_core
