#include "al_scope.hpp"
#include "al_core.hpp"
#include <stdexcept>

namespace asmlower {

const char* name_class_name(NameClass cls) {
    switch (cls) {
        case NameClass::BuiltinConstant: return "BuiltinConstant";
        case NameClass::Local:           return "Local";
        case NameClass::Global:          return "Global";
    }
    return "<unknown>";
}

std::optional<int64_t> builtin_constant_value(const std::string& name) {
    if (name == "True") return 1;
    if (name == "False") return 0;
    if (name == "None") return 0;
    return std::nullopt;
}

void Scope::declare_param(const std::string& name, size_t index, size_t count) {
    if (contains(name)) {
        throw std::runtime_error("Duplicate parameter '" + name + "' in function " + owner_);
    }
    // Arguments are pushed left to right, so the last one sits right above
    // the return address.
    int64_t displacement = 16 + 8 * static_cast<int64_t>(count - 1 - index);
    slots_.emplace(name, Operand::frame_slot(displacement));
    order_.push_back(name);
}

Operand Scope::declare_local(const std::string& name) {
    auto it = slots_.find(name);
    if (it != slots_.end()) {
        return it->second;
    }
    ++frame_slots_;
    Operand slot = Operand::frame_slot(-8 * static_cast<int64_t>(frame_slots_));
    slots_.emplace(name, slot);
    order_.push_back(name);
    AL_DEBUG_LOWER("%s: local '%s' at [rbp%lld]", owner_.c_str(), name.c_str(),
                   static_cast<long long>(slot.value));
    return slot;
}

Operand Scope::slot(const std::string& name) const {
    auto it = slots_.find(name);
    if (it == slots_.end()) {
        throw std::runtime_error("'" + name + "' is not local to " + owner_);
    }
    return it->second;
}

Resolution resolve_name(const std::string& name, const Scope& scope, CompilationContext& ctx) {
    Resolution res;

    if (auto builtin = builtin_constant_value(name)) {
        res.name_class = NameClass::BuiltinConstant;
        res.builtin_value = *builtin;
        return res;
    }

    if (scope.contains(name)) {
        res.name_class = NameClass::Local;
        res.storage = scope.slot(name);
        return res;
    }

    // Unresolved names are not an error: the first sighting makes them global.
    if (ctx.globals().promote(name)) {
        AL_DEBUG_LOWER("%s: '%s' unresolved, promoted to global", scope.owner().c_str(), name.c_str());
    }
    res.name_class = NameClass::Global;
    res.storage = Operand::global(global_symbol(name));
    return res;
}

} // namespace asmlower
