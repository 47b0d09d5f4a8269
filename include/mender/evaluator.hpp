#pragma once

#include "mender/document.hpp"
#include "mender/program.hpp"
#include "mender/result.hpp"

namespace mender {

// ============================================================================
// Operation Evaluator
// ============================================================================
//
// Evaluates one step's operation against a document. Operands are read
// through resolve() (literal path, then fallback prefixes). The document is
// never modified; the caller writes the returned value to step.output_path.
//
// Failures carry the step id, the operation kind and the error kind:
//   path_not_found       operand unresolved after fallback search
//   type_mismatch        operand has the wrong shape
//   division_by_zero     divide denominator is exactly 0
//   empty_aggregate      min/max over an empty array
//   index_out_of_bounds  operand path indexes past the end of an array
//   non_finite_result    arithmetic overflowed to inf or NaN

Result<Document, StepError> evaluate(const Step& step, const Document& document);

// Relative tolerance used by filter_numeric's "eq"
bool numbers_equal(double a, double b);

} // namespace mender
