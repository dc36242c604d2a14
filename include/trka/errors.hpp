#pragma once

/// @file include/trka/errors.hpp
/// @brief Typed failures of the analysis pipeline and the Outcome<T> carrier.
///
/// # Error Model
/// The core never throws, never aborts and never logs. Every fallible
/// operation returns an `Outcome<T>` holding either the complete value or a
/// single `AnalysisError`. There is no partial result: a failure anywhere in
/// the pipeline discards everything computed so far.
///
/// Heuristic outputs (mud index, exposure, environment tags) never fail; they
/// degrade to `Unknown` / empty instead.

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace trka {

enum class ErrorKind {
    InsufficientData,  ///< Fewer than two usable distinct points
    TemporalOrder,     ///< Timestamp regression while timestamps are load-bearing
    InvalidProfile,    ///< Runner profile or plan parameters out of plausible range
    MalformedPoint,    ///< Latitude/longitude/elevation out of range or non-finite
};

[[nodiscard]] const char* to_string(ErrorKind k) noexcept;

struct AnalysisError {
    ErrorKind                  kind;
    std::string                message;
    std::optional<std::size_t> point_index;  ///< Offending raw point, if any

    [[nodiscard]] std::string to_string() const;
};

/// Value-or-error result.
///
/// Mirrors the `std::optional` surface (`has_value`, `*`, `->`) so call sites
/// read the same as the rest of the codebase, and adds `error()`.
template <typename T>
class Outcome {
public:
    Outcome(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Outcome(AnalysisError error) : state_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool has_value() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    /// Precondition: has_value().
    [[nodiscard]] T&       value() &       { return std::get<0>(state_); }
    [[nodiscard]] const T& value() const&  { return std::get<0>(state_); }
    [[nodiscard]] T&&      value() &&      { return std::get<0>(std::move(state_)); }

    [[nodiscard]] T&       operator*() &      { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T*       operator->()       { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    /// Precondition: !has_value().
    [[nodiscard]] const AnalysisError& error() const& { return std::get<1>(state_); }

private:
    std::variant<T, AnalysisError> state_;
};

/// Convenience constructor used at failure sites.
[[nodiscard]] inline AnalysisError
make_error(ErrorKind kind,
           std::string message,
           std::optional<std::size_t> point_index = std::nullopt) {
    return AnalysisError{
        .kind        = kind,
        .message     = std::move(message),
        .point_index = point_index,
    };
}

}  // namespace trka
