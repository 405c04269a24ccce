#pragma once

// Aggregator header for the core value types.
#include "statute_core/types/chunk.hpp"
#include "statute_core/types/document.hpp"
