#include <jot-cpp/error.hpp>
#include <jot-cpp/objects.hpp>
#include <jot-cpp/random.hpp>

#include <functional>
#include <iterator>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace jot_cpp {

namespace {

auto pick(RandomEngine& rng, std::size_t count) -> std::size_t {
    return std::uniform_int_distribution<std::size_t>{0, count - 1}(rng);
}

auto random_integer(RandomEngine& rng, const RandomOptions& options) -> std::int64_t {
    return std::uniform_int_distribution<std::int64_t>{options.min_integer,
                                                       options.max_integer}(rng);
}

auto random_key(RandomEngine& rng, const RandomOptions& options) -> std::string {
    return "k" + std::to_string(pick(rng, options.key_space));
}

auto random_string(RandomEngine& rng) -> std::string {
    static constexpr char alphabet[] = "abcdefghijklmnopqrstuvwxyz";
    auto out = std::string(pick(rng, 6), ' ');
    for (auto& c : out) c = alphabet[pick(rng, sizeof(alphabet) - 1)];
    return out;
}

auto random_value_at(RandomEngine& rng, const RandomOptions& options, std::size_t depth)
    -> Value {
    const auto kinds = depth < options.max_depth ? std::size_t{6} : std::size_t{4};
    switch (pick(rng, kinds)) {
        case 0: return nullptr;
        case 1: return pick(rng, 2) == 1;
        case 2: return random_integer(rng, options);
        case 3: return random_string(rng);
        case 4: {
            auto array = Value::array();
            for (auto n = pick(rng, 4); n > 0; --n) {
                array.push_back(random_value_at(rng, options, depth + 1));
            }
            return array;
        }
        default: {
            auto object = Value::object();
            for (auto n = pick(rng, 4); n > 0; --n) {
                object[random_key(rng, options)] = random_value_at(rng, options, depth + 1);
            }
            return object;
        }
    }
}

}  // anonymous namespace

auto random_value(RandomEngine& rng, const RandomOptions& options) -> Value {
    return random_value_at(rng, options, 0);
}

auto random_object_operation(const Value& document, RandomEngine& rng,
                             const RandomOptions& options) -> Operation {
    if (!document.is_object()) {
        throw Exception{ErrorKind::type_mismatch,
                        "random object operation needs an object, got " + to_string(document)};
    }
    if (document.empty()) {
        return put(random_key(rng, options), random_value(rng, options));
    }
    // Choice 0 puts a new key, 1 renames an existing key, 2 copies an existing
    // key onto another one, and choice i > 2 recurses into the (i - 3)-th key.
    const auto choice = pick(rng, document.size() + 3);
    if (choice == 0) {
        return put(random_key(rng, options), random_value(rng, options));
    }
    if (choice <= 2) {
        auto source = document.begin();
        std::advance(source, pick(rng, document.size()));
        auto target = random_key(rng, options);
        if (target == source.key()) {
            return put(std::move(target), random_value(rng, options));
        }
        if (choice == 1) return rename(source.key(), std::move(target));
        const auto copy = Copy{};
        return Apply{std::map<std::string, Operation>{
            {source.key(), copy},
            {std::move(target), Paste{copy}},
        }};
    }
    auto it = document.begin();
    std::advance(it, choice - 3);
    return Apply{it.key(), random_operation(*it, rng, RandomContext::property, options)};
}

auto random_operation(const Value& document, RandomEngine& rng, RandomContext context,
                      const RandomOptions& options) -> Operation {
    auto choices = std::vector<std::function<Operation()>>{};
    choices.emplace_back([&] { return Operation{Set{random_value(rng, options)}}; });
    if (context == RandomContext::property && !is_missing(document)) {
        choices.emplace_back([] { return Operation{Set{missing()}}; });
    }
    if (document.is_number()) {
        choices.emplace_back([&] {
            return Operation{Math{MathOperator::add, random_integer(rng, options)}};
        });
        choices.emplace_back([&] {
            return Operation{Math{MathOperator::mult, Value(std::int64_t{2})}};
        });
    }
    if (document.is_object()) {
        choices.emplace_back([&] { return random_object_operation(document, rng, options); });
    }
    return choices[pick(rng, choices.size())]();
}

}  // namespace jot_cpp
