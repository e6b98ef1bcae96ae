/**
 * @file Log.hpp
 * @brief Leveled diagnostic output
 *
 * Lines are built with stream syntax and written when the temporary goes
 * out of scope:
 * ```cpp
 * log::warning() << clashes.size() << " name clashes found in " << src;
 * ```
 * Output goes to std::cerr unless another sink is installed. Lines below
 * the current level cost one comparison.
 */

#ifndef TREELINK_LOG_HPP
#define TREELINK_LOG_HPP

#include <ostream>
#include <sstream>
#include <string>

namespace treelink::log {

enum class Level { Debug = 0, Info, Warning, Error, Off };

void set_level(Level level) noexcept;
Level level() noexcept;

// nullptr restores std::cerr
void set_sink(std::ostream* sink) noexcept;

/**
 * @brief Parse "debug", "info", "warning"/"warn", "error" or "off"
 * @throws std::invalid_argument for anything else
 */
Level parse_level(const std::string& name);

const char* level_name(Level level) noexcept;

class Line {
public:
    explicit Line(Level level) : level_(level), enabled_(level >= log::level()) {}
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <typename T>
    Line& operator<<(const T& value) {
        if (enabled_) buffer_ << value;
        return *this;
    }

private:
    Level level_;
    bool enabled_;
    std::ostringstream buffer_;
};

inline Line debug() { return Line(Level::Debug); }
inline Line info() { return Line(Level::Info); }
inline Line warning() { return Line(Level::Warning); }
inline Line error() { return Line(Level::Error); }

} // namespace treelink::log

#endif // TREELINK_LOG_HPP
