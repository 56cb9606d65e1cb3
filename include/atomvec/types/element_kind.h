#ifndef ATOMVEC_TYPES_ELEMENT_KIND_H
#define ATOMVEC_TYPES_ELEMENT_KIND_H

#include <atomvec/atomvec_export.h>

#include <fmt/format.h>

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace atomvec {

    using av_bool = bool;
    using av_int = int64_t;
    using av_float = double;
    using av_string = std::string;

    /**
     * ElementKind - The four atomic element kinds.
     *
     * Declaration order is the coercion order: Logical < Integer < Double < Character.
     * The enumerator value doubles as the index of the kind's alternative in
     * Vector::storage_t.
     */
    enum class ElementKind : uint8_t {
        Logical,
        Integer,
        Double,
        Character,
    };

    inline constexpr size_t element_kind_count = 4;

    // An element is an optional value, the empty optional is the kind's NA
    template<typename T>
    using element_t = std::optional<T>;

    template<typename T>
    using column_t = std::vector<std::optional<T>>;

    template<ElementKind K>
    struct kind_traits;

    template<>
    struct kind_traits<ElementKind::Logical> {
        using value_type = av_bool;
    };

    template<>
    struct kind_traits<ElementKind::Integer> {
        using value_type = av_int;
    };

    template<>
    struct kind_traits<ElementKind::Double> {
        using value_type = av_float;
    };

    template<>
    struct kind_traits<ElementKind::Character> {
        using value_type = av_string;
    };

    template<ElementKind K>
    using value_type_t = typename kind_traits<K>::value_type;

    template<typename T>
    concept ElementType = std::same_as<T, av_bool> || std::same_as<T, av_int> ||
                          std::same_as<T, av_float> || std::same_as<T, av_string>;

    template<ElementType T>
    inline constexpr ElementKind kind_of_v = std::same_as<T, av_bool>  ? ElementKind::Logical
                                           : std::same_as<T, av_int>   ? ElementKind::Integer
                                           : std::same_as<T, av_float> ? ElementKind::Double
                                                                       : ElementKind::Character;

    /**
     * KindFlags - Properties of an element kind
     */
    enum class KindFlags : uint32_t {
        None = 0,
        Numeric = 1 << 0,     // Takes part in arithmetic (logical counts as 0/1)
        Ordered = 1 << 1,     // Supports < and friends
        Boolean = 1 << 2,     // Supports three-valued & and |
        Fractional = 1 << 3,  // Has NaN / Inf in addition to NA
    };

    inline constexpr KindFlags operator|(KindFlags a, KindFlags b) {
        return static_cast<KindFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }

    inline constexpr bool has_flag(KindFlags flags, KindFlags test) {
        return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(test)) != 0;
    }

    /**
     * KindMeta - Static descriptor of an element kind.
     */
    struct KindMeta {
        ElementKind kind;
        int rank;
        KindFlags flags;
        const char* name;      // "logical", "integer", "double", "character"
        size_t value_size;     // sizeof of the element value type

        [[nodiscard]] bool is_numeric() const { return has_flag(flags, KindFlags::Numeric); }
        [[nodiscard]] bool is_ordered() const { return has_flag(flags, KindFlags::Ordered); }
        [[nodiscard]] bool is_boolean() const { return has_flag(flags, KindFlags::Boolean); }
        [[nodiscard]] bool is_fractional() const { return has_flag(flags, KindFlags::Fractional); }
    };

    [[nodiscard]] ATOMVEC_EXPORT const KindMeta& kind_meta(ElementKind kind);

    [[nodiscard]] ATOMVEC_EXPORT const char* kind_name(ElementKind kind);

    // Inverse of kind_name, throws InvalidArgumentError for unknown names
    [[nodiscard]] ATOMVEC_EXPORT ElementKind kind_from_string(const std::string& name);

    /**
     * visit_kind - Call f(std::type_identity<T>{}) with T the value type of kind.
     */
    template<typename F>
    decltype(auto) visit_kind(ElementKind kind, F&& f) {
        switch (kind) {
            case ElementKind::Logical: return f(std::type_identity<av_bool>{});
            case ElementKind::Integer: return f(std::type_identity<av_int>{});
            case ElementKind::Double: return f(std::type_identity<av_float>{});
            case ElementKind::Character: break;
        }
        return f(std::type_identity<av_string>{});
    }

} // namespace atomvec

template<>
struct fmt::formatter<atomvec::ElementKind> : fmt::formatter<fmt::string_view> {
    template<typename FormatContext>
    auto format(atomvec::ElementKind kind, FormatContext& ctx) const {
        return fmt::formatter<fmt::string_view>::format(atomvec::kind_name(kind), ctx);
    }
};

#endif // ATOMVEC_TYPES_ELEMENT_KIND_H
