#include "librtprov/type_utils.hpp"
#include "librtprov/class_info.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace librtprov {

namespace {

using bindings = std::unordered_map<type_expr, type_expr>;

bool is_object(const type_expr& t) noexcept {
    return t.as_raw() == &object_class();
}

/// Rebuild `t` bottom-up, replacing every type variable by `on_variable(v)`.
template <typename Fn>
type_expr rebuild(const type_expr& t, const Fn& on_variable) {
    auto all = [&](const std::vector<type_expr>& types) {
        std::vector<type_expr> out;
        out.reserve(types.size());
        for (const auto& x : types) out.push_back(rebuild(x, on_variable));
        return out;
    };

    switch (t.kind()) {
        case type_kind::raw:
            return t;

        case type_kind::variable:
            return on_variable(t);

        case type_kind::wildcard: {
            const auto* w = t.as_wildcard();
            if (!w->lower_bounds.empty()) return type_expr::wildcard_super(all(w->lower_bounds));
            return type_expr::wildcard_extends(all(w->upper_bounds));
        }

        case type_kind::parameterized: {
            const auto* p = t.as_parameterized();
            if (p->owner) {
                return type_expr::parameterized(rebuild(*p->owner, on_variable), *p->raw,
                                                all(p->arguments));
            }
            return type_expr::parameterized(*p->raw, all(p->arguments));
        }

        case type_kind::array:
            return type_expr::array_of(rebuild(t.as_array()->component, on_variable));
    }
    return t;
}

// ---------------------------------------------------------------
// Variable detection
// ---------------------------------------------------------------

class variable_detector {
public:
    bool matches(const type_expr& t) {
        if (!seen_.insert(t).second) return false;

        switch (t.kind()) {
            case type_kind::variable:
                return true;
            case type_kind::raw:
                return false;
            case type_kind::wildcard: {
                const auto* w = t.as_wildcard();
                return any(w->lower_bounds) || any(w->upper_bounds);
            }
            case type_kind::parameterized: {
                const auto* p = t.as_parameterized();
                if (p->owner && matches(*p->owner)) return true;
                return any(p->arguments);
            }
            case type_kind::array:
                return matches(t.as_array()->component);
        }
        return false;
    }

private:
    bool any(const std::vector<type_expr>& types) {
        for (const auto& x : types) {
            if (matches(x)) return true;
        }
        return false;
    }

    std::unordered_set<type_expr> seen_;
};

// ---------------------------------------------------------------
// Capture conversion
// ---------------------------------------------------------------

class capture_arena {
public:
    type_expr mint(std::vector<type_expr> bounds) {
        std::string name = "capture#" + std::to_string(++next_) + " of ? extends ";
        for (std::size_t i = 0; i < bounds.size(); ++i) {
            if (i > 0) name += " & ";
            name += bounds[i].to_string();
        }
        auto site = std::make_shared<capture_site>();
        site->name = std::move(name);
        site->bounds = std::move(bounds);
        return type_expr::capture(std::move(site));
    }

private:
    int next_ = 0;
};

/// `position` is the declared parameter that `t` is an argument for, if any.
type_expr capture_convert(const type_expr& t, capture_arena& arena,
                          const type_parameter* position) {
    switch (t.kind()) {
        case type_kind::raw:
        case type_kind::variable:
            return t;

        case type_kind::wildcard: {
            const auto* w = t.as_wildcard();
            if (!w->lower_bounds.empty()) return t;

            std::vector<type_expr> bounds;
            auto add_unique = [&](const type_expr& b) {
                if (std::find(bounds.begin(), bounds.end(), b) == bounds.end())
                    bounds.push_back(b);
            };
            for (const auto& b : w->upper_bounds) add_unique(b);
            if (position) {
                for (const auto& b : position->bounds()) add_unique(b);
                if (bounds.size() > 1) std::erase_if(bounds, is_object);
            }
            return arena.mint(std::move(bounds));
        }

        case type_kind::parameterized: {
            const auto* p = t.as_parameterized();
            const auto& params = p->raw->type_parameters();
            std::vector<type_expr> args;
            args.reserve(p->arguments.size());
            for (std::size_t i = 0; i < p->arguments.size(); ++i) {
                const type_parameter* param = i < params.size() ? &params[i] : nullptr;
                args.push_back(capture_convert(p->arguments[i], arena, param));
            }
            if (p->owner) {
                return type_expr::parameterized(capture_convert(*p->owner, arena, nullptr),
                                                *p->raw, std::move(args));
            }
            return type_expr::parameterized(*p->raw, std::move(args));
        }

        case type_kind::array:
            return type_expr::array_of(capture_convert(t.as_array()->component, arena, nullptr));
    }
    return t;
}

// ---------------------------------------------------------------
// Variable mappings
// ---------------------------------------------------------------

class variable_mappings {
public:
    explicit variable_mappings(const type_expr& context) {
        capture_arena arena;
        add(capture_convert(context, arena, nullptr));
    }

    /// Follows variable-to-variable chains until an unmapped variable or a
    /// non-variable type is reached.
    type_expr get(type_expr t) const {
        for (std::size_t steps = 0; steps <= map_.size() && t.kind() == type_kind::variable; ++steps) {
            auto it = map_.find(t);
            if (it == map_.end()) break;
            t = it->second;
        }
        return t;
    }

private:
    void add(const type_expr& t) {
        if (!seen_.insert(t).second) return;

        switch (t.kind()) {
            case type_kind::variable:
                add_all(t.as_variable()->bounds());
                break;

            case type_kind::raw: {
                const auto* cls = t.as_raw();
                if (cls->superclass()) add(cls->superclass()->type);
                for (const auto& iface : cls->interfaces()) add(iface.type);
                break;
            }

            case type_kind::wildcard:
                add_all(t.as_wildcard()->upper_bounds);
                break;

            case type_kind::parameterized: {
                const auto* p = t.as_parameterized();
                const auto& params = p->raw->type_parameters();
                std::size_t n = std::min(params.size(), p->arguments.size());
                for (std::size_t i = 0; i < n; ++i) {
                    map_.emplace(params[i].as_type(), p->arguments[i]);
                }
                add(type_expr(*p->raw));
                if (p->owner) add(*p->owner);
                break;
            }

            case type_kind::array:
                add(t.as_array()->component);
                break;
        }
    }

    void add_all(const std::vector<type_expr>& types) {
        for (const auto& x : types) add(x);
    }

    std::unordered_set<type_expr> seen_;
    bindings map_;
};

type_expr substitute(const type_expr& t, const bindings& map) {
    return rebuild(t, [&](const type_expr& v) {
        auto it = map.find(v);
        return it == map.end() ? v : it->second;
    });
}

bool contains_argument(const type_expr& to_arg, const type_expr& from_arg) {
    if (const auto* w = to_arg.as_wildcard()) {
        for (const auto& lower : w->lower_bounds) {
            if (!is_assignable(from_arg, lower)) return false;
        }
        for (const auto& upper : w->upper_bounds) {
            if (!is_assignable(upper, from_arg)) return false;
        }
        return true;
    }
    return to_arg == from_arg;
}

} // namespace

// ---------------------------------------------------------------
// Public API
// ---------------------------------------------------------------

bool contains_type_variable(const type_expr& type) {
    return variable_detector{}.matches(type);
}

type_expr resolve_type(const type_expr& context, const type_expr& dependent) {
    variable_mappings mappings(context);
    return rebuild(dependent, [&](const type_expr& v) { return mappings.get(v); });
}

const class_info* raw_class(const type_expr& type) noexcept {
    if (const auto* raw = type.as_raw()) return raw;
    if (const auto* p = type.as_parameterized()) return p->raw;
    return nullptr;
}

std::vector<type_expr> supertypes_of(const type_expr& type) {
    std::vector<type_expr> result{type};
    std::unordered_set<type_expr> seen{type};

    for (std::size_t i = 0; i < result.size(); ++i) {
        const type_expr current = result[i];
        const class_info* cls = raw_class(current);
        if (!cls) continue;

        bindings map;
        bool erase = false;
        if (const auto* p = current.as_parameterized()) {
            const auto& params = cls->type_parameters();
            std::size_t n = std::min(params.size(), p->arguments.size());
            for (std::size_t k = 0; k < n; ++k) map.emplace(params[k].as_type(), p->arguments[k]);
        } else {
            erase = !cls->type_parameters().empty();
        }

        auto visit = [&](const supertype_info& s) {
            type_expr st = s.type;
            if (erase) {
                if (const auto* raw = raw_class(st)) st = type_expr(*raw);
            } else {
                st = substitute(st, map);
            }
            if (seen.insert(st).second) result.push_back(st);
        };

        if (cls->superclass()) visit(*cls->superclass());
        for (const auto& iface : cls->interfaces()) visit(iface);
    }
    return result;
}

bool is_assignable(const type_expr& to, const type_expr& from) {
    if (to == from || is_object(to)) return true;

    switch (from.kind()) {
        case type_kind::variable:
            for (const auto& b : from.as_variable()->bounds()) {
                if (is_assignable(to, b)) return true;
            }
            return false;

        case type_kind::wildcard:
            for (const auto& b : from.as_wildcard()->upper_bounds) {
                if (is_assignable(to, b)) return true;
            }
            return false;

        case type_kind::array:
            return to.kind() == type_kind::array
                && is_assignable(to.as_array()->component, from.as_array()->component);

        case type_kind::raw:
        case type_kind::parameterized:
            break;
    }

    const class_info* to_raw = raw_class(to);
    const class_info* from_raw = raw_class(from);
    if (!to_raw || !from_raw || !from_raw->is_subclass_of(*to_raw)) return false;

    const auto* target = to.as_parameterized();
    if (!target) return true;

    for (const auto& st : supertypes_of(from)) {
        if (raw_class(st) != to_raw) continue;
        const auto* source = st.as_parameterized();
        if (!source) return true;  // raw reference, unchecked
        if (source->arguments.size() != target->arguments.size()) return false;
        for (std::size_t i = 0; i < target->arguments.size(); ++i) {
            if (!contains_argument(target->arguments[i], source->arguments[i])) return false;
        }
        return true;
    }
    return false;
}

} // namespace librtprov
