#ifndef ATOMVEC_TYPES_VECTOR_H
#define ATOMVEC_TYPES_VECTOR_H

#include <atomvec/atomvec_export.h>
#include <atomvec/types/element_kind.h>
#include <atomvec/types/named_index.h>
#include <atomvec/types/type_lattice.h>
#include <atomvec/util/errors.h>

#include <fmt/format.h>

#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace atomvec {

    using name_list_t = std::vector<std::string>;

    /**
     * Vector - An ordered, homogeneously typed, one dimensional sequence of elements.
     *
     * Every value handled by the engine is a Vector; a scalar is a vector of length one.
     * Elements are std::optional values of the kind's value type, the empty optional
     * being the kind's NA. A vector may carry a name per element (an unnamed element has
     * the empty string); when names are present there is exactly one per element.
     *
     * Vectors have value semantics: copies are deep and share nothing.
     *
     * Mutation (set, set_names, resize, promote and atomvec::assign) needs exclusive
     * access; const member functions are safe to call concurrently.
     */
    class ATOMVEC_EXPORT Vector {
    public:
        // Alternative order follows ElementKind
        using storage_t = std::variant<column_t<av_bool>, column_t<av_int>, column_t<av_float>, column_t<av_string>>;

        // The untyped empty vector: length 0 of the lattice bottom (Logical)
        Vector() = default;

        // length NA elements of the given kind
        explicit Vector(ElementKind kind, size_t length = 0);

        template<ElementType T>
        explicit Vector(column_t<T> values) : _storage{std::move(values)} {}

        template<ElementType T>
        Vector(column_t<T> values, name_list_t names) : _storage{std::move(values)} {
            set_names(std::move(names));
        }

        static Vector logical(column_t<av_bool> values) { return Vector{std::move(values)}; }
        static Vector integer(column_t<av_int> values) { return Vector{std::move(values)}; }
        static Vector numeric(column_t<av_float> values) { return Vector{std::move(values)}; }
        static Vector character(column_t<av_string> values) { return Vector{std::move(values)}; }

        // A single NA of the given kind
        static Vector na(ElementKind kind) { return Vector{kind, 1}; }

        [[nodiscard]] ElementKind kind() const { return static_cast<ElementKind>(_storage.index()); }
        [[nodiscard]] const KindMeta& meta() const { return kind_meta(kind()); }
        [[nodiscard]] size_t length() const;
        [[nodiscard]] bool empty() const { return length() == 0; }

        template<ElementType T>
        [[nodiscard]] bool is() const { return std::holds_alternative<column_t<T>>(_storage); }

        template<ElementType T>
        [[nodiscard]] const column_t<T>& data() const {
            if (auto* column = std::get_if<column_t<T>>(&_storage)) return *column;
            throw_error<InvalidOperandError>("Vector of kind {} accessed as {}", kind(), kind_of_v<T>);
        }

        template<ElementType T>
        [[nodiscard]] column_t<T>& data() {
            if (auto* column = std::get_if<column_t<T>>(&_storage)) return *column;
            throw_error<InvalidOperandError>("Vector of kind {} accessed as {}", kind(), kind_of_v<T>);
        }

        // Element i (0-based), kind must match T
        template<ElementType T>
        [[nodiscard]] const std::optional<T>& at(size_t i) const {
            const auto& column = data<T>();
            if (i >= column.size()) {
                throw std::out_of_range(fmt::format("Vector::at: index {} out of range for length {}", i, column.size()));
            }
            return column[i];
        }

        [[nodiscard]] bool is_na(size_t i) const;

        // Element i as a length one vector of the same kind, keeping its name
        [[nodiscard]] Vector get(size_t i) const;

        // Writes element i (0-based, in range); values of a higher kind promote the whole vector
        template<ElementType T>
        void set(size_t i, std::optional<T> value) {
            if (i >= length()) {
                throw std::out_of_range(fmt::format("Vector::set: index {} out of range for length {}", i, length()));
            }
            promote(higher_kind(kind(), kind_of_v<T>));
            std::visit([&](auto& column) {
                using U = typename std::decay_t<decltype(column)>::value_type::value_type;
                if constexpr (can_coerce(kind_of_v<T>, kind_of_v<U>)) {
                    column[i] = coerce<U>(value);
                }
            }, _storage);
        }

        [[nodiscard]] const storage_t& storage() const { return _storage; }
        [[nodiscard]] storage_t& storage() { return _storage; }

        template<typename F>
        decltype(auto) visit(F&& f) const { return std::visit(std::forward<F>(f), _storage); }

        template<typename F>
        decltype(auto) visit(F&& f) { return std::visit(std::forward<F>(f), _storage); }

        // ---- names --------------------------------------------------------

        [[nodiscard]] bool has_names() const { return _names.has_value(); }
        [[nodiscard]] std::optional<name_list_t> names() const;
        [[nodiscard]] const NameTable* name_table() const { return _names ? &*_names : nullptr; }

        // Empty string when the vector is unnamed
        [[nodiscard]] const std::string& name(size_t i) const;

        /**
         * Replace the names. A shorter list is padded with empty names, a longer list
         * throws InvalidArgumentError, std::nullopt removes the names.
         */
        void set_names(std::optional<name_list_t> names);

        void set_name(size_t i, std::string name);

        // First position (0-based) carrying name, following the first-match policy
        [[nodiscard]] std::optional<size_t> find_name(const std::string& name) const;

        // ---- shape and kind ------------------------------------------------

        /**
         * Grow or shrink to n elements. New slots hold NA and, when the vector is named,
         * an empty name.
         */
        void resize(size_t n);

        // Coerce every element in place to a kind at or above the current one
        void promote(ElementKind target);

        // Copy coerced to target (upward only, throws CoercionError otherwise)
        [[nodiscard]] Vector coerced(ElementKind target) const;

        // Appends other (promoting as needed); names are merged as in combine
        void append(const Vector& other);

        // Structural equality: kind, elements (NA == NA) and names
        [[nodiscard]] bool operator==(const Vector& other) const;

        // Debug rendering, e.g. <double>[1, 2.5, NA] or <integer>{a=1, b=2}
        [[nodiscard]] std::string to_string() const;

    private:
        storage_t _storage;
        std::optional<NameTable> _names;
    };

    // Explicit whole-vector coercion up the lattice; names are kept
    [[nodiscard]] ATOMVEC_EXPORT Vector as_kind(const Vector& v, ElementKind kind);

    [[nodiscard]] inline std::string to_string(const Vector& v) { return v.to_string(); }

    ATOMVEC_EXPORT std::ostream& operator<<(std::ostream& os, const Vector& v);

} // namespace atomvec

template<>
struct fmt::formatter<atomvec::Vector> : fmt::formatter<fmt::string_view> {
    template<typename FormatContext>
    auto format(const atomvec::Vector& v, FormatContext& ctx) const {
        return fmt::formatter<fmt::string_view>::format(v.to_string(), ctx);
    }
};

#endif // ATOMVEC_TYPES_VECTOR_H
