#include "dependency_resolver.hpp"
#include "logger.hpp"

#include <jot-cpp/error.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace jot_cpp::detail {

auto build_dependency_graph(const std::map<std::string, Operation>& ops) -> DependencyGraph {
    auto copies = std::map<Symbol, std::set<std::string>>{};
    auto pastes = std::map<Symbol, std::set<std::string>>{};
    for (const auto& [key, op] : ops) {
        op.visit([&, &key = key](const Operation& node) {
            if (const auto* copy = node.get_if<Copy>()) copies[copy->symbol].insert(key);
            if (const auto* paste = node.get_if<Paste>()) pastes[paste->symbol].insert(key);
        });
    }

    auto graph = DependencyGraph{};
    for (const auto& [symbol, pasting_keys] : pastes) {
        auto it = copies.find(symbol);
        if (it == copies.end()) continue;  // pasted here, copied elsewhere
        for (const auto& pasting : pasting_keys) {
            for (const auto& copying : it->second) {
                if (pasting != copying) {
                    graph.depends_on[pasting].insert(copying);
                }
            }
        }
    }
    return graph;
}

namespace {

class Flattener {
public:
    explicit Flattener(const DependencyGraph& graph) : graph_{graph} {}

    void flatten(const std::string& key) {
        if (std::ranges::find(path_, key) != path_.end()) {
            throw_cycle(key);
        }
        if (done_.contains(key)) return;

        auto it = graph_.depends_on.find(key);
        if (it != graph_.depends_on.end()) {
            path_.push_back(key);
            for (const auto& dependency : it->second) {
                flatten(dependency);
            }
            path_.pop_back();
        }
        done_.insert(key);
        order_.push_back(key);
    }

    auto take_order() -> std::vector<std::string> { return std::move(order_); }

private:
    [[noreturn]] void throw_cycle(const std::string& key) const {
        auto start = std::ranges::find(path_, key);
        auto message = std::string{"circular dependency between properties due to COPY/PASTE: "};
        for (auto it = start; it != path_.end(); ++it) {
            message += Value(*it).dump() + " -> ";
        }
        message += Value(key).dump();
        logger().debug("{}", message);
        throw Exception{ErrorKind::circular_dependency, std::move(message)};
    }

    const DependencyGraph& graph_;
    std::vector<std::string> path_;   // recursion in progress
    std::set<std::string> done_;
    std::vector<std::string> order_;
};

}  // anonymous namespace

auto flatten_dependencies(const std::vector<std::string>& keys,
                          const DependencyGraph& graph) -> std::vector<std::string> {
    auto sorted = keys;
    std::ranges::sort(sorted);
    auto flattener = Flattener{graph};
    for (const auto& key : sorted) {
        flattener.flatten(key);
    }
    return flattener.take_order();
}

auto resolve_evaluation_order(const std::map<std::string, Operation>& ops)
    -> std::vector<std::string> {
    auto keys = std::vector<std::string>{};
    keys.reserve(ops.size());
    for (const auto& [key, op] : ops) keys.push_back(key);
    return flatten_dependencies(keys, build_dependency_graph(ops));
}

}  // namespace jot_cpp::detail
