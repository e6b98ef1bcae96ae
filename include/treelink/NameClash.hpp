/**
 * @file NameClash.hpp
 * @brief Record of name clashes seen during a merge run
 *
 * A clash is data, not an error: extend() records one event per call that
 * found overlapping keys. Strict-side events mean the run must not write
 * its output; graceful-side events only feed a warning summary. The
 * orchestration owns one NameClashSet per run and decides what to do with
 * it at the end.
 */

#ifndef TREELINK_NAMECLASH_HPP
#define TREELINK_NAMECLASH_HPP

#include <string>
#include <vector>

namespace treelink {

enum class MergeMode { Strict, Graceful };

const char* mode_name(MergeMode mode) noexcept;

/**
 * @brief One extend() call that met existing keys
 */
struct ClashEvent {
    std::string source_document;
    std::string source_container;
    std::string destination_container;
    MergeMode mode = MergeMode::Strict;
    std::vector<std::string> keys;
};

class NameClashSet {
public:
    // Routes the event to the strict or graceful side by its mode
    void record(ClashEvent event);

    bool any_strict_clash() const noexcept { return !strict_.empty(); }
    bool any_graceful_clash() const noexcept { return !graceful_.empty(); }

    const std::vector<ClashEvent>& strict_events() const noexcept { return strict_; }
    const std::vector<ClashEvent>& graceful_events() const noexcept { return graceful_; }

    void reset() noexcept;

    /**
     * @brief Multi-line human readable report of every event
     *
     * Example:
     * ```
     * strict: 1 clash(es) merging /Signals (a.json) into /Signals: [S1]
     * ```
     */
    std::string summary() const;

private:
    std::vector<ClashEvent> strict_;
    std::vector<ClashEvent> graceful_;
};

} // namespace treelink

#endif // TREELINK_NAMECLASH_HPP
