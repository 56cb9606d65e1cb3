#include <atomvec/types/type_lattice.h>
#include <atomvec/util/options.h>

#include <array>
#include <cmath>

namespace atomvec {

    namespace {
        constexpr std::array<KindMeta, element_kind_count> kind_table{{
            {ElementKind::Logical, 0, KindFlags::Numeric | KindFlags::Ordered | KindFlags::Boolean, "logical",
             sizeof(av_bool)},
            {ElementKind::Integer, 1, KindFlags::Numeric | KindFlags::Ordered, "integer", sizeof(av_int)},
            {ElementKind::Double, 2, KindFlags::Numeric | KindFlags::Ordered | KindFlags::Fractional, "double",
             sizeof(av_float)},
            {ElementKind::Character, 3, KindFlags::Ordered, "character", sizeof(av_string)},
        }};
    } // namespace

    const KindMeta& kind_meta(ElementKind kind) {
        return kind_table[static_cast<size_t>(kind)];
    }

    const char* kind_name(ElementKind kind) {
        return kind_meta(kind).name;
    }

    ElementKind kind_from_string(const std::string& name) {
        for (const auto& meta : kind_table) {
            if (name == meta.name) return meta.kind;
        }
        throw_error<InvalidArgumentError>("unknown element kind: '{}'", name);
    }

    ElementKind common_kind(std::initializer_list<ElementKind> kinds) {
        ElementKind result{ElementKind::Logical};
        for (auto kind : kinds) result = higher_kind(result, kind);
        return result;
    }

    ElementKind common_kind(const std::vector<ElementKind>& kinds) {
        ElementKind result{ElementKind::Logical};
        for (auto kind : kinds) result = higher_kind(result, kind);
        return result;
    }

    std::string format_double(double value) {
        return format_double(value, options().character_digits);
    }

    std::string format_double(double value, int digits) {
        if (std::isnan(value)) return "NaN";
        if (std::isinf(value)) return value > 0 ? "Inf" : "-Inf";
        // Avoid "-0"
        if (value == 0.0) return "0";
        return fmt::format("{:.{}g}", value, digits);
    }

} // namespace atomvec
