#include "resolution_context.hpp"

#include <algorithm>
#include <iterator>

#include "errors.hpp"

namespace portwire {

void ResolutionContext::enter(const std::string& port_name)
{
    if (in_progress_.count(port_name)) {
        auto start = std::find(path_.begin(), path_.end(), port_name);
        std::vector<std::string> chain(start, path_.end());
        chain.push_back(port_name);
        throw CircularDependencyError(std::move(chain));
    }
    in_progress_.insert(port_name);
    path_.push_back(port_name);
}

void ResolutionContext::exit(const std::string& port_name)
{
    in_progress_.erase(port_name);
    if (!path_.empty() && path_.back() == port_name) {
        path_.pop_back();
        return;
    }
    auto it = std::find(path_.rbegin(), path_.rend(), port_name);
    if (it != path_.rend()) path_.erase(std::next(it).base());
}

} // namespace portwire
