#include <atomvec/ops/index_resolver.h>
#include <atomvec/util/parallel.h>

#include <ankerl/unordered_dense.h>

#include <algorithm>

namespace atomvec {

    namespace {
        // Ascending positions of 1..n not excluded by the (non-positive) values
        std::vector<size_t> complement(const IndexSpec::positions_t& values, size_t n) {
            std::vector<bool> excluded(n, false);
            for (const auto& value : values) {
                // Zeros are ignored, as are exclusions past the end
                if (*value < 0 && static_cast<uint64_t>(-(*value + 1)) < n) {
                    excluded[static_cast<size_t>(-(*value + 1))] = true;
                }
            }
            std::vector<size_t> result;
            result.reserve(n);
            for (size_t i = 0; i < n; ++i) {
                if (!excluded[i]) result.push_back(i);
            }
            return result;
        }

        // Number of slots a mask of length m covers over a vector of length n
        size_t mask_extent(size_t m, size_t n) {
            return m == 0 ? 0 : std::max(m, n);
        }
    } // namespace

    ReadPlan resolve_read(const Vector& v, const IndexSpec& spec) {
        const size_t n = v.length();
        ReadPlan plan;

        switch (spec.kind()) {
            case IndexKind::Positive: {
                const auto& values = spec.position_values();
                plan.slots.reserve(values.size());
                for (const auto& value : values) {
                    if (!value) {
                        plan.slots.emplace_back(std::nullopt);
                    } else if (*value == 0) {
                        continue;
                    } else if (static_cast<uint64_t>(*value) <= n) {
                        plan.slots.emplace_back(static_cast<size_t>(*value - 1));
                    } else {
                        plan.slots.emplace_back(std::nullopt);
                    }
                }
                break;
            }
            case IndexKind::Negative: {
                for (size_t position : complement(spec.position_values(), n)) {
                    plan.slots.emplace_back(position);
                }
                break;
            }
            case IndexKind::Mask: {
                const auto& mask = spec.mask_values();
                const size_t extent = mask_extent(mask.size(), n);
                for (size_t i = 0; i < extent; ++i) {
                    const auto& selected = mask[i % mask.size()];
                    if (!selected) {
                        plan.slots.emplace_back(std::nullopt);
                    } else if (*selected) {
                        plan.slots.emplace_back(i < n ? std::optional<size_t>{i} : std::nullopt);
                    }
                }
                break;
            }
            case IndexKind::Names: {
                const auto& names = spec.name_values();
                plan.slots.reserve(names.size());
                for (const auto& name : names) {
                    plan.slots.emplace_back(name ? v.find_name(*name) : std::nullopt);
                }
                break;
            }
        }
        return plan;
    }

    WritePlan resolve_write(const Vector& v, const IndexSpec& spec) {
        const size_t n = v.length();
        WritePlan plan;
        plan.required_length = n;

        switch (spec.kind()) {
            case IndexKind::Positive: {
                for (const auto& value : spec.position_values()) {
                    // NA positions are skipped on write
                    if (!value || *value == 0) continue;
                    auto position = static_cast<size_t>(*value - 1);
                    plan.positions.push_back(position);
                    plan.required_length = std::max(plan.required_length, position + 1);
                }
                break;
            }
            case IndexKind::Negative: {
                plan.positions = complement(spec.position_values(), n);
                break;
            }
            case IndexKind::Mask: {
                const auto& mask = spec.mask_values();
                const size_t extent = mask_extent(mask.size(), n);
                for (size_t i = 0; i < extent; ++i) {
                    const auto& selected = mask[i % mask.size()];
                    if (selected && *selected) {
                        plan.positions.push_back(i);
                        plan.required_length = std::max(plan.required_length, i + 1);
                    }
                }
                break;
            }
            case IndexKind::Names: {
                // Unmatched names get slots after the current end, one per distinct name
                ankerl::unordered_dense::map<std::string, size_t> created;
                for (const auto& name : spec.name_values()) {
                    if (!name) continue;
                    if (auto found = v.find_name(*name)) {
                        plan.positions.push_back(*found);
                        continue;
                    }
                    auto [it, inserted] = created.try_emplace(*name, plan.required_length);
                    if (inserted) {
                        plan.new_names.emplace_back(it->second, *name);
                        ++plan.required_length;
                    }
                    plan.positions.push_back(it->second);
                }
                break;
            }
        }
        return plan;
    }

    Vector extract(const Vector& v, const IndexSpec& spec) {
        const ReadPlan plan = resolve_read(v, spec);

        Vector result = v.visit([&plan](const auto& column) {
            using T = typename std::decay_t<decltype(column)>::value_type::value_type;
            column_t<T> out(plan.size());
            for_each(plan.size(), [&](size_t i) {
                if (const auto& slot = plan.slots[i]) out[i] = column[*slot];
            });
            return Vector{std::move(out)};
        });

        if (v.has_names()) {
            name_list_t names(plan.size());
            for (size_t i = 0; i < plan.size(); ++i) {
                if (const auto& slot = plan.slots[i]) names[i] = v.name(*slot);
            }
            result.set_names(std::move(names));
        }
        return result;
    }

    Vector extract(const Vector& v, const Vector& index) {
        return extract(v, IndexSpec::from_vector(index));
    }

} // namespace atomvec
