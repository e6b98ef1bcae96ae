/**
 * @file Run.hpp
 * @brief One complete merge run, as driven by the command line
 *
 * Loads the plan and the destination, applies the plan's layouts, copies
 * the planned packages of each source in turn, relocates references after
 * every source, then checks clashes and missing packages. The output file
 * is written only when the whole run succeeded.
 */

#ifndef TREELINK_RUN_HPP
#define TREELINK_RUN_HPP

#include "treelink/Log.hpp"
#include "treelink/Plan.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace treelink {

struct RunOptions {
    std::string dst_path;
    std::vector<std::string> src_paths; // merged in this order
    std::string out_path;
    PlanOptions plan;
    std::optional<log::Level> log_level; // beats the plan's [log] level
};

/**
 * @brief Merge every source into the destination and save the result
 *
 * Failures (strict clashes, packages missing from the sources, load or
 * plan errors) are written to err and nothing is saved.
 *
 * @return Exit status: 0 when out_path was written, 1 otherwise
 */
int run_merge(const RunOptions& options, std::ostream& err);

/**
 * @brief Split "a,b,,c" into {"a", "b", "c"}
 */
std::vector<std::string> split_list(const std::string& s, char delim);

} // namespace treelink

#endif // TREELINK_RUN_HPP
