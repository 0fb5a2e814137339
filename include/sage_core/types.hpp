#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. sage_core/types/chunk.hpp),
// users can simply do `#include "sage_core/types.hpp"`.
//
#include "sage_core/types/answer.hpp"
#include "sage_core/types/chunk.hpp"
#include "sage_core/types/document.hpp"
#include "sage_core/types/passage.hpp"
