#pragma once

// Ordering of the keys of an Apply so that every Copy runs before the
// Pastes that use its symbol.
//
// Internal header, not installed.

#include <jot-cpp/op.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace jot_cpp::detail {

// Edges "key -> keys it must run after".
struct DependencyGraph {
    std::map<std::string, std::set<std::string>> depends_on;

    auto has_edges() const -> bool { return !depends_on.empty(); }
};

// Record, per key, the symbols it copies and pastes, and add an edge from a
// pasting key to every other key copying the same symbol.
auto build_dependency_graph(const std::map<std::string, Operation>& ops) -> DependencyGraph;

// Depth-first flattening: a key's dependencies come before the key. Keys are
// visited in lexicographic order, so keys without constraints keep that order.
// Every key in `keys` appears exactly once in the result.
// @throws Exception (circular_dependency) naming the cycle.
auto flatten_dependencies(const std::vector<std::string>& keys,
                          const DependencyGraph& graph) -> std::vector<std::string>;

// build_dependency_graph + flatten_dependencies over all keys of `ops`.
auto resolve_evaluation_order(const std::map<std::string, Operation>& ops)
    -> std::vector<std::string>;

}  // namespace jot_cpp::detail
