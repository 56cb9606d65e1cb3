#ifndef ATOMVEC_OPS_INDEX_RESOLVER_H
#define ATOMVEC_OPS_INDEX_RESOLVER_H

#include <atomvec/atomvec_export.h>
#include <atomvec/ops/index_spec.h>
#include <atomvec/types/vector.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace atomvec {

    /**
     * ReadPlan - The slots an extraction produces, in selector order.
     *
     * Each slot is a 0-based position of the source or std::nullopt for a missing
     * slot (out of range position, NA selector or unmatched name), which reads as NA.
     */
    struct ReadPlan {
        std::vector<std::optional<size_t>> slots;

        [[nodiscard]] size_t size() const { return slots.size(); }
    };

    /**
     * WritePlan - Where an assignment writes, in selector order.
     *
     * positions are 0-based and may lie at or beyond the current length, in which
     * case the target must first grow to required_length. new_names holds the names
     * given to slots created by unmatched name selectors.
     */
    struct WritePlan {
        std::vector<size_t> positions;
        size_t required_length{0};
        std::vector<std::pair<size_t, std::string>> new_names;
    };

    [[nodiscard]] ATOMVEC_EXPORT ReadPlan resolve_read(const Vector& v, const IndexSpec& spec);

    [[nodiscard]] ATOMVEC_EXPORT WritePlan resolve_write(const Vector& v, const IndexSpec& spec);

    /**
     * extract - A new vector holding the selected elements of v.
     *
     * Order and duplicates follow the selector; missing slots hold NA of v's kind and the
     * empty name. The result is named iff v is, and shares nothing with v.
     */
    [[nodiscard]] ATOMVEC_EXPORT Vector extract(const Vector& v, const IndexSpec& spec);

    // Index given as a vector, see IndexSpec::from_vector
    [[nodiscard]] ATOMVEC_EXPORT Vector extract(const Vector& v, const Vector& index);

} // namespace atomvec

#endif // ATOMVEC_OPS_INDEX_RESOLVER_H
