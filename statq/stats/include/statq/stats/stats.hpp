#pragma once

// Umbrella header for the stats module

#include <statq/stats/query_error.hpp>
#include <statq/stats/qualifier.hpp>
#include <statq/stats/stat_definition.hpp>
#include <statq/stats/stat_operation.hpp>
#include <statq/stats/value.hpp>
#include <statq/stats/stat_defaults.hpp>
#include <statq/stats/stat_value.hpp>
#include <statq/stats/stat_map.hpp>
#include <statq/stats/evaluation_key.hpp>
#include <statq/stats/evaluation_context.hpp>
#include <statq/stats/stat_source.hpp>
#include <statq/stats/stat_cache.hpp>
#include <statq/stats/querier.hpp>
#include <statq/stats/stat_config.hpp>
