#pragma once

/// @file types.hpp
/// @brief Strong id types shared by the backend and the orchestrator.

#include <cstdint>
#include <functional>

namespace arank::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct RequestIdTag {};
struct SessionIdTag {};

/// Correlator echoed by every backend response.
using RequestId = StrongId<RequestIdTag>;

/// Identifies one ranking session in log output.
using SessionId = StrongId<SessionIdTag>;

} // namespace arank::foundation

template <typename Tag, typename T>
struct std::hash<arank::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const arank::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
