#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"


///////////////////////////
///        DEMOS        ///
///////////////////////////
/**
 * @brief Size of the synthetic demo instances used by the drivers.
 */
enum class DemoSize { S, M, L };

/**
 * @brief Build a synthetic, feasible timetabling instance.
 *
 * S is a small hand-written department (two batches, one practical, one
 * pinned seminar and some faculty preferences); M and L are generated
 * departments with more batches, subjects and staff.
 */
ProblemInstance makeDemoInstance(DemoSize size);
