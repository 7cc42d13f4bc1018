#pragma once

#include <sdfvm/instruction.h>

namespace sdfvm {

// New value of a register after merging `result` into it. None and values
// outside the enum leave the register untouched.
float combine(CombineOp op, float reg, float result, float parameter);

float sigmoid(float x);

} // namespace sdfvm
