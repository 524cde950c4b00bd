#pragma once

/// @file types.hpp
/// @brief Strong ID types and connection identity shared by the lobby service.

#include <compare>
#include <cstdint>
#include <functional>
#include <string>

namespace lcs::foundation {

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

struct PeerIdTag {};

/// Identifier of a connected peer, assigned by the transport layer.
using PeerId = StrongId<PeerIdTag>;

/// Connection identity handed to every lobby request.
///
/// The transport authenticates the connection and assigns the permission
/// level before any lobby handler sees it.
struct PeerInfo {
    PeerId id;
    int32_t permissionLevel = 0;
    std::string username;
};

} // namespace lcs::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<lcs::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const lcs::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
