#include "al_context.hpp"

namespace asmlower {

bool GlobalScope::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.count(name) != 0;
}

bool GlobalScope::promote(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.insert(name).second;
}

std::vector<std::string> GlobalScope::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(names_.begin(), names_.end());
}

size_t GlobalScope::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.size();
}

std::string global_symbol(const std::string& name) {
    return "g_" + name;
}

} // namespace asmlower
