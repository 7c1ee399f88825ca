/**
 * @file process_supervisor.hpp
 * @brief Bounded execution of the external renderer
 *
 * @details run_process() starts a child with stdout and stderr on separate
 *          pipes and multiplexes both with poll() until the child exits or
 *          the deadline passes. Neither stream can fill its pipe buffer and
 *          stall the child while the other is being read.
 *
 * @attention TIMEOUT:
 *
 *   - The child runs in its own process group; on timeout the whole group
 *     receives SIGKILL (the renderer script spawns its own children)
 *
 *   - The child is always reaped before run_process() returns
 *
 *   - Output already captured is kept and returned with the TimedOut status
 *
 * @note Descriptors above stderr are closed in the child before exec, so a
 *       long render never holds server sockets open.
 */

#ifndef PROJECTM_POD_PROCESS_SUPERVISOR_HPP
#define PROJECTM_POD_PROCESS_SUPERVISOR_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "types.hpp"

namespace projectm_pod {

/**
 * @brief Run argv (PATH lookup for argv[0]) under a wall-clock timeout.
 * @param argv Program and arguments; no shell is involved
 * @param timeout_sec Budget in seconds (<= 0 or above 1e8 waits indefinitely)
 * @return Outcome with status Exited, TimedOut or LaunchFailed
 */
ProcessOutcome run_process(const std::vector<std::string> &argv,
                           double timeout_sec);

/**
 * @brief Classify a finished renderer run.
 * @details Priority: TimedOut > LaunchFailed > NonZeroExit > OutputMissing
 *          > Success.
 * @param output Path the renderer was asked to write
 */
RenderStatus classify_render(const ProcessOutcome &outcome,
                             const std::filesystem::path &output);

} // namespace projectm_pod

#endif // PROJECTM_POD_PROCESS_SUPERVISOR_HPP
