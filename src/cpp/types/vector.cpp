#include <atomvec/types/vector.h>

#include <fmt/ranges.h>

#include <cmath>

namespace atomvec {

    namespace {
        template<ElementType T>
        bool same_element(const std::optional<T>& a, const std::optional<T>& b) {
            if (!a || !b) return !a && !b;
            if constexpr (std::same_as<T, av_float>) {
                if (std::isnan(*a) || std::isnan(*b)) return std::isnan(*a) && std::isnan(*b);
            }
            return *a == *b;
        }

        template<ElementType T>
        std::string element_text(const std::optional<T>& value) {
            if (!value) return "NA";
            if constexpr (std::same_as<T, av_string>) {
                return fmt::format("\"{}\"", *value);
            } else {
                return format_value(*value);
            }
        }

        Vector::storage_t make_storage(ElementKind kind, size_t length) {
            return visit_kind(kind, [length]<typename T>(std::type_identity<T>) -> Vector::storage_t {
                return column_t<T>(length);
            });
        }
    } // namespace

    Vector::Vector(ElementKind kind, size_t length) : _storage{make_storage(kind, length)} {}

    size_t Vector::length() const {
        return std::visit([](const auto& column) { return column.size(); }, _storage);
    }

    bool Vector::is_na(size_t i) const {
        return std::visit([i](const auto& column) { return !column.at(i).has_value(); }, _storage);
    }

    Vector Vector::get(size_t i) const {
        if (i >= length()) {
            throw std::out_of_range(fmt::format("Vector::get: index {} out of range for length {}", i, length()));
        }
        Vector result = std::visit([i](const auto& column) {
            using T = typename std::decay_t<decltype(column)>::value_type::value_type;
            return Vector{column_t<T>{column[i]}};
        }, _storage);
        if (_names) result.set_names(name_list_t{(*_names)[i]});
        return result;
    }

    std::optional<name_list_t> Vector::names() const {
        if (!_names) return std::nullopt;
        return _names->names();
    }

    const std::string& Vector::name(size_t i) const {
        static const std::string unnamed;
        if (i >= length()) {
            throw std::out_of_range(fmt::format("Vector::name: index {} out of range for length {}", i, length()));
        }
        return _names ? (*_names)[i] : unnamed;
    }

    void Vector::set_names(std::optional<name_list_t> names) {
        if (!names) {
            _names.reset();
            return;
        }
        if (names->size() > length()) {
            throw_error<InvalidArgumentError>("{} names supplied for a vector of length {}", names->size(), length());
        }
        names->resize(length());
        _names.emplace(std::move(*names));
    }

    void Vector::set_name(size_t i, std::string name) {
        if (i >= length()) {
            throw std::out_of_range(fmt::format("Vector::set_name: index {} out of range for length {}", i, length()));
        }
        if (!_names) _names.emplace(name_list_t(length()));
        _names->set(i, std::move(name));
    }

    std::optional<size_t> Vector::find_name(const std::string& name) const {
        if (!_names || name.empty()) return std::nullopt;
        return _names->find(name);
    }

    void Vector::resize(size_t n) {
        std::visit([n](auto& column) { column.resize(n); }, _storage);
        if (_names) _names->resize(n);
    }

    void Vector::promote(ElementKind target) {
        if (target == kind()) return;
        if (!can_coerce(kind(), target)) {
            throw_error<CoercionError>("cannot coerce {} to {}: coercion only moves up the lattice", kind(), target);
        }
        _storage = std::visit([target](const auto& column) -> storage_t {
            using From = typename std::decay_t<decltype(column)>::value_type::value_type;
            return visit_kind(target, [&column]<typename To>(std::type_identity<To>) -> storage_t {
                return coerce_column_checked<To, From>(column);
            });
        }, _storage);
    }

    Vector Vector::coerced(ElementKind target) const {
        Vector result{*this};
        result.promote(target);
        return result;
    }

    void Vector::append(const Vector& other) {
        size_t old_length = length();
        ElementKind target = higher_kind(kind(), other.kind());
        // Copied up front, other may alias *this
        Vector tail = other.coerced(target);
        promote(target);
        std::visit([&tail](auto& column) {
            using T = typename std::decay_t<decltype(column)>::value_type::value_type;
            const auto& source = tail.data<T>();
            column.insert(column.end(), source.begin(), source.end());
        }, _storage);

        if (_names || tail._names) {
            if (!_names) _names.emplace(name_list_t(old_length));
            if (tail._names) {
                _names->append(*tail._names);
            } else {
                _names->resize(length());
            }
        }
    }

    bool Vector::operator==(const Vector& other) const {
        if (kind() != other.kind() || length() != other.length()) return false;
        if (has_names() != other.has_names()) return false;
        if (_names && !(*_names == *other._names)) return false;
        return std::visit([&other](const auto& column) {
            using T = typename std::decay_t<decltype(column)>::value_type::value_type;
            const auto& rhs = other.data<T>();
            for (size_t i = 0; i < column.size(); ++i) {
                if (!same_element(column[i], rhs[i])) return false;
            }
            return true;
        }, _storage);
    }

    std::string Vector::to_string() const {
        return std::visit([this](const auto& column) {
            std::vector<std::string> items;
            items.reserve(column.size());
            for (size_t i = 0; i < column.size(); ++i) {
                if (_names) {
                    items.push_back(fmt::format("{}={}", (*_names)[i], element_text(column[i])));
                } else {
                    items.push_back(element_text(column[i]));
                }
            }
            return _names ? fmt::format("<{}>{{{}}}", kind(), fmt::join(items, ", "))
                          : fmt::format("<{}>[{}]", kind(), fmt::join(items, ", "));
        }, _storage);
    }

    Vector as_kind(const Vector& v, ElementKind kind) {
        return v.coerced(kind);
    }

    std::ostream& operator<<(std::ostream& os, const Vector& v) {
        return os << v.to_string();
    }

} // namespace atomvec
