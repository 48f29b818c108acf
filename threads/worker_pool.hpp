#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <functional>


///////////////////////////
///     WORKER POOL     ///
///////////////////////////
/**
 * @brief Bounded fork/join loop over [0, count).
 *
 * Splits the index range into at most numThreads contiguous chunks and runs
 * each chunk as a std::async task; the call returns only after every chunk
 * has finished, so it doubles as a generation barrier. With numThreads <= 1
 * (or a single item) the body runs inline on the calling thread.
 *
 * The body must only touch state owned by its own index. The first
 * exception thrown by a chunk is rethrown to the caller after all chunks
 * have been joined.
 */
void parallelFor(int count, int numThreads, const std::function<void(int)>& body);

/**
 * @brief Resolve a requested thread count.
 *
 * Values <= 0 mean "use the hardware", falling back to 4 when the hardware
 * concurrency is unknown.
 */
int resolveThreadCount(int requested);
