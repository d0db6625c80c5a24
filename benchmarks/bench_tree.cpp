/**
 * CommTree Tree Benchmarks
 */

#include <benchmark/benchmark.h>
#include "commtree/commtree.hpp"
#include <vector>
#include <random>

using namespace commtree;

namespace {

// Synthetic comment records shaped like the category feature inputs
std::vector<Entity> make_comments(size_t n, uint32_t seed) {
    static const char* kTypes[] = {"line", "block", "doc"};
    static const char* kWords[] = {"returns", "todo", "param", "the", "value", "fix", "see"};
    static const char* kPos[] = {"NN", "VB", "JJ", "DT", "IN"};
    static const char* kLabels[] = {"header", "inline", "todo", "doc"};

    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> type_dist(0, 2);
    std::uniform_int_distribution<int> word_dist(0, 6);
    std::uniform_int_distribution<int> pos_dist(0, 4);
    std::uniform_int_distribution<int> label_dist(0, 3);
    std::uniform_int_distribution<int> line_dist(1, 400);

    std::vector<Entity> entities;
    entities.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        int t = type_dist(rng);
        Entity e(kLabels[(t + label_dist(rng) / 3) % 4]);
        e.set("type", kTypes[t]);
        e.set("words", std::string(kWords[word_dist(rng)]) + "," + kWords[word_dist(rng)]);
        e.set("posTags", std::string(kPos[pos_dist(rng)]) + "," + kPos[pos_dist(rng)]);
        e.set("line", std::to_string(line_dist(rng)));
        e.set("prevLine", std::to_string(line_dist(rng)));
        derive_comment_deltas(e);
        entities.push_back(std::move(e));
    }
    return entities;
}

} // namespace

// Benchmark entropy-driven induction
static void BM_TreeBuild(benchmark::State& state) {
    size_t n_entities = static_cast<size_t>(state.range(0));
    auto entities = make_comments(n_entities, 42);
    auto list = make_entity_list(entities);
    auto registry = FeatureRegistry::comment_categories();
    TreeBuilder builder(registry, BuilderConfig());

    for (auto _ : state) {
        auto root = builder.build(list);
        benchmark::DoNotOptimize(root);
    }

    state.SetItemsProcessed(state.iterations() * n_entities);
}
BENCHMARK(BM_TreeBuild)->Range(100, 10000);

// Benchmark classification of unseen entities
static void BM_TreeClassify(benchmark::State& state) {
    size_t n_entities = static_cast<size_t>(state.range(0));
    auto training = make_comments(2000, 42);
    auto entities = make_comments(n_entities, 123);
    auto registry = FeatureRegistry::comment_categories();
    Tree tree = TreeBuilder(registry, BuilderConfig()).fit(training);

    for (auto _ : state) {
        for (const auto& e : entities) {
            const Label& label = tree.classify(e);
            benchmark::DoNotOptimize(label);
        }
    }

    state.SetItemsProcessed(state.iterations() * n_entities);
}
BENCHMARK(BM_TreeClassify)->Range(100, 10000);

// Benchmark quantitative threshold search alone
static void BM_QuantitativeSplit(benchmark::State& state) {
    size_t n_entities = static_cast<size_t>(state.range(0));
    auto entities = make_comments(n_entities, 7);
    auto list = make_entity_list(entities);
    QuantitativeFeature feature("deltaLine");

    for (auto _ : state) {
        Split split = feature.split(list);
        benchmark::DoNotOptimize(split.weighted_entropy);
    }

    state.SetItemsProcessed(state.iterations() * n_entities);
}
BENCHMARK(BM_QuantitativeSplit)->Range(100, 10000);

BENCHMARK_MAIN();
