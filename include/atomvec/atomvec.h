//
// Convenience header that includes the whole public surface of the engine.
//

#ifndef ATOMVEC_ATOMVEC_H
#define ATOMVEC_ATOMVEC_H

#include <atomvec/util/errors.h>
#include <atomvec/util/options.h>
#include <atomvec/util/warnings.h>
#include <atomvec/types/element_kind.h>
#include <atomvec/types/type_lattice.h>
#include <atomvec/types/vector.h>
#include <atomvec/types/construction.h>
#include <atomvec/ops/recycler.h>
#include <atomvec/ops/index_spec.h>
#include <atomvec/ops/index_resolver.h>
#include <atomvec/ops/vector_ops.h>
#include <atomvec/ops/mutation.h>

#endif // ATOMVEC_ATOMVEC_H
