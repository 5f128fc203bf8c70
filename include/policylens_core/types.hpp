#pragma once

// Aggregator header for the record types.
// Instead of including each individual header (e.g. policylens_core/types/chunk.hpp),
// users can simply do `#include "policylens_core/types.hpp"`.
//
#include "policylens_core/types/chunk.hpp"
#include "policylens_core/types/page.hpp"
#include "policylens_core/types/search_result.hpp"
