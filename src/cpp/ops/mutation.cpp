#include <atomvec/ops/index_resolver.h>
#include <atomvec/ops/mutation.h>
#include <atomvec/ops/recycler.h>

namespace atomvec {

    namespace {
        void write_values(Vector& v, const WritePlan& plan, const Vector& values, const Alignment& alignment) {
            v.visit([&](auto& column) {
                using T = typename std::decay_t<decltype(column)>::value_type::value_type;
                const auto& source = values.data<T>();
                for (size_t i = 0; i < plan.positions.size(); ++i) {
                    column[plan.positions[i]] = source[alignment.index_b(i)];
                }
            });
        }
    } // namespace

    Vector& assign(Vector& v, const IndexSpec& spec, const Vector& rhs) {
        // Everything that can fail happens before v is touched
        WritePlan plan = resolve_write(v, spec);
        if (plan.positions.empty()) return v;

        auto alignment = fit(plan.positions.size(), rhs.length());
        const ElementKind target = higher_kind(v.kind(), rhs.kind());
        const Vector values = rhs.coerced(target);

        const bool reshapes = target != v.kind() || plan.required_length > v.length() || !plan.new_names.empty();
        if (!reshapes) {
            write_values(v, plan, values, alignment);
            alignment.report();
            return v;
        }

        // Promotion, growth and naming are staged on a copy, v is replaced only once they succeed
        Vector next = v.coerced(target);
        next.visit([&plan](const auto& column) {
            if (plan.required_length > column.max_size()) {
                throw_error<InvalidIndexError>("cannot grow a vector to length {}", plan.required_length);
            }
        });
        if (plan.required_length > next.length()) next.resize(plan.required_length);
        for (auto& [position, name] : plan.new_names) {
            next.set_name(position, std::move(name));
        }
        write_values(next, plan, values, alignment);

        v = std::move(next);
        alignment.report();
        return v;
    }

    Vector& assign(Vector& v, const Vector& index, const Vector& rhs) {
        return assign(v, IndexSpec::from_vector(index), rhs);
    }

} // namespace atomvec
