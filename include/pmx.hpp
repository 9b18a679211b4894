#pragma once

/**
 * @file pmx.hpp
 * @brief Failure model for the market-data exploration pipeline
 *
 * Stage failures (fetch, source, parse, normalize, analyze, present), the
 * top-level AppError they are promoted into, the context formatting helpers
 * and the presentation layer.
 *
 * Collaborator adapters (pmx/adapters/...) are not included here because
 * they pull in third-party headers; include them where needed.
 */

#include "pmx/app_error.hpp"
#include "pmx/config.hpp"
#include "pmx/context_format.hpp"
#include "pmx/errors/analysis_error.hpp"
#include "pmx/errors/data_source_error.hpp"
#include "pmx/errors/http_error.hpp"
#include "pmx/errors/normalization_error.hpp"
#include "pmx/errors/output_error.hpp"
#include "pmx/errors/parse_error.hpp"
#include "pmx/expected.hpp"
#include "pmx/log.hpp"
#include "pmx/presentation.hpp"
#include "pmx/types.hpp"
