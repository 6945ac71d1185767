#pragma once

/// @file types.hpp
/// @brief Strong ID types for tracked entities.

#include <cstdint>
#include <functional>

namespace pbt::foundation {

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

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct ProjectIdTag {};

/// Identifier of a tracked project (tenant). Zero is a valid project.
using ProjectId = StrongId<ProjectIdTag>;

} // namespace pbt::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<pbt::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const pbt::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
