#ifndef ATOMVEC_OPS_MUTATION_H
#define ATOMVEC_OPS_MUTATION_H

#include <atomvec/atomvec_export.h>
#include <atomvec/ops/index_spec.h>
#include <atomvec/types/vector.h>

namespace atomvec {

    /**
     * assign - Write rhs into the positions of v selected by spec, in place.
     *
     * rhs is recycled over the selected positions (RecycleLength warning when their
     * count is not a multiple of its length). Positions past the end grow v, filling
     * with NA and empty names; names that did not match are recorded on the new
     * slots. v is promoted when rhs has the higher kind, otherwise rhs is coerced to
     * v's kind. Later duplicate positions win.
     *
     * All-or-nothing: when an error is thrown v is left exactly as it was. Needs
     * exclusive access to v.
     */
    ATOMVEC_EXPORT Vector& assign(Vector& v, const IndexSpec& spec, const Vector& rhs);

    // Index given as a vector, see IndexSpec::from_vector
    ATOMVEC_EXPORT Vector& assign(Vector& v, const Vector& index, const Vector& rhs);

} // namespace atomvec

#endif // ATOMVEC_OPS_MUTATION_H
