#include "wheatgrass/context.hpp"
#include "wheatgrass/exceptions.hpp"
#include "diagnostics.hpp"

#include <algorithm>
#include <optional>
#include <source_location>
#include <string>
#include <vector>

namespace wheatgrass {

namespace {

/// Bindings never satisfy their own rebinding; everything else may match
/// itself (and is then reported as a cycle).
std::optional<std::size_t> self_exclusion(const binding& desc, std::size_t idx) {
    if (desc.is_transform()) return idx;
    return std::nullopt;
}

// ------------------------------------------------------------------
// Check that every declared dependency has a matching binding
// ------------------------------------------------------------------
void check_missing_dependencies(const binding_table& table,
                                std::source_location loc) {
    for (std::size_t i = 0; i < table.bindings.size(); ++i) {
        const auto& desc = table.bindings[i];
        for (const auto& dep : desc.dependencies) {
            auto m = table.match(dep.target, self_exclusion(desc, i));
            if (m.index) continue;

            // Tell the user which binding requires the missing key.
            std::string hint;
            if (m.candidates > 1) {
                hint = std::to_string(m.candidates) + " bindings match by type; ";
            }
            hint += "required by " + desc.bound_key.to_string();
            if (desc.registration_location.file_name()[0]) {
                hint += " registered at "
                    + std::string(desc.registration_location.file_name())
                    + ":" + std::to_string(desc.registration_location.line());
            }
            auto ex = unresolved_binding(dep.target, hint, loc);
            ex.set_diagnostic_detail(internal::format_registration_trace(desc));
            throw ex;
        }
    }
}

// ------------------------------------------------------------------
// Cycle detection (DFS on the binding dependency graph)
// ------------------------------------------------------------------
enum class visit_state { unvisited, in_progress, done };

void dfs(std::size_t node,
         const binding_table& table,
         std::vector<visit_state>& states,
         std::vector<std::size_t>& path,
         std::source_location loc) {
    auto& state = states[node];
    if (state == visit_state::done) return;
    if (state == visit_state::in_progress) {
        // Build cycle path from where the node first appears
        auto it = std::find(path.begin(), path.end(), node);
        std::vector<key> cycle;
        std::string detail;
        for (; it != path.end(); ++it) {
            cycle.push_back(table.bindings[*it].bound_key);
            std::string trace = internal::format_registration_trace(table.bindings[*it]);
            if (!trace.empty()) {
                if (!detail.empty()) detail += "\n";
                detail += trace;
            }
        }
        cycle.push_back(table.bindings[node].bound_key);
        auto ex = cyclic_binding(cycle, loc);
        if (!detail.empty()) ex.set_diagnostic_detail(detail);
        throw ex;
    }

    state = visit_state::in_progress;
    path.push_back(node);

    const auto& desc = table.bindings[node];
    for (const auto& dep : desc.dependencies) {
        // A provider argument is resolved later, on demand: no edge.
        if (dep.deferred) continue;
        auto m = table.match(dep.target, self_exclusion(desc, node));
        if (m.index) dfs(*m.index, table, states, path, loc);
    }

    path.pop_back();
    state = visit_state::done;
}

void check_cycles(const binding_table& table, std::source_location loc) {
    std::vector<visit_state> states(table.bindings.size(), visit_state::unvisited);
    std::vector<std::size_t> path;

    for (std::size_t i = 0; i < table.bindings.size(); ++i) {
        if (states[i] == visit_state::unvisited) {
            dfs(i, table, states, path, loc);
        }
    }
}

} // anonymous namespace

// ------------------------------------------------------------------
// Public entry point called by root_injector_builder::build
// ------------------------------------------------------------------
void validate_bindings(const binding_table& table, std::source_location loc) {
    check_missing_dependencies(table, loc);
    check_cycles(table, loc);
}

} // namespace wheatgrass
