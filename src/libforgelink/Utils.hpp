#ifndef forgelink_Utils_hpp_
#define forgelink_Utils_hpp_

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "libforgelink.h"

namespace ForgeLink {

extern void set_logging_level(unsigned int level);
extern unsigned int level_string_to_boost(std::string level);
extern std::string  get_string_logging_level(unsigned level);
extern unsigned get_logging_level();
// Add a rotating file sink below data_dir()/log. Severity, time stamp and thread id prefix every record.
// Throws FileIOError if the log directory cannot be created.
extern void set_log_path_and_level(const std::string& file, unsigned int level);
extern void flush_logs();

// Directory holding the log folder and the default forgelink.ini, created if missing.
// Throws FileIOError if it cannot be created.
void set_data_dir(const std::string &path);
const std::string& data_dir();

// Format a byte count for humans, e.g. "12.3 KB".
extern std::string format_memsize(size_t bytes, unsigned int decimals = 1);

// Split a device reply into lines, dropping the trailing '\r' and surrounding whitespace.
// Empty lines are skipped.
inline std::vector<std::string> split_reply_lines(const std::string &reply)
{
    std::vector<std::string> lines;
    boost::split(lines, reply, boost::is_any_of("\n"));
    std::vector<std::string> out;
    out.reserve(lines.size());
    for (std::string &line : lines) {
        boost::algorithm::trim(line);
        if (! line.empty())
            out.emplace_back(std::move(line));
    }
    return out;
}

// Strip NUL padding and whitespace from a fixed size field of a binary packet.
inline std::string trim_fixed_field(const std::string &field)
{
    std::string out = field.substr(0, field.find('\0'));
    boost::algorithm::trim(out);
    return out;
}

// Runs the closure when leaving the scope, unless reset() was called.
class ScopeGuard
{
public:
    typedef std::function<void()> Closure;

    ScopeGuard() {}
    ScopeGuard(Closure closure) : closure(std::move(closure)) {}
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard(ScopeGuard &&other) : closure(std::move(other.closure)) {}

    ~ScopeGuard()
    {
        if (closure) { closure(); }
    }

    ScopeGuard& operator=(const ScopeGuard&) = delete;

    void reset() { closure = Closure(); }

private:
    Closure closure;
};

} // namespace ForgeLink

#endif // forgelink_Utils_hpp_
