#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace assetforge::core{

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i32 = std::int32_t;
    using i64 = std::int64_t;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);


    // Row identifiers. invalid() stands for SQL NULL on nullable references.
    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(~Repr{0})}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    struct ItemIdTag {};
    using ItemId = Id<ItemIdTag, i64>;

    struct TypeIdTag {};
    using TypeId = Id<TypeIdTag, i64>;

    struct LocationIdTag {};
    using LocationId = Id<LocationIdTag, i64>;

    struct UserIdTag {};
    using UserId = Id<UserIdTag, i64>;

    struct GroupIdTag {};
    using GroupId = Id<GroupIdTag, i64>;

    struct SubTypeIdTag {};
    using SubTypeId = Id<SubTypeIdTag, i64>;

    struct UpdateIdTag {};
    using UpdateId = Id<UpdateIdTag, i64>;

    static_assert(std::is_trivially_copyable_v<ItemId>);
    static_assert(std::is_standard_layout_v<ItemId>);
    static_assert(std::is_trivially_copyable_v<Hash256>);

} // namespace assetforge::core
