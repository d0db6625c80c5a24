/**
 * CommTree Command-Line Tool
 *
 * Training:
 *   $ commtree -k category comments.jsonl > comments.tree.json
 * Testing:
 *   $ commtree -k category -f comments.tree.json comments.jsonl
 */

#include "commtree/commtree.hpp"
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {

int usage(const char* prog) {
    std::fprintf(stderr,
        "usage: %s [-d] [-t] [-m mincount] [-e minentropy] [-k labelattr]\n"
        "          [-f tree.json] [-o out.json] [file ...]\n"
        "\n"
        "  -d   increase verbosity (repeatable)\n"
        "  -t   use the comment target features instead of categories\n"
        "  -m   minimum entities per branch (default 10)\n"
        "  -e   minimum entropy per branch (default 0.10)\n"
        "  -k   attribute holding the label (default key)\n"
        "  -f   score the given tree instead of training\n"
        "  -o   write the trained tree here instead of stdout\n"
        "  -V   print version information\n",
        prog);
    return 100;
}

struct Options {
    commtree::Config config;
    std::string tree_path;
    std::string output_path;
    std::vector<std::string> inputs;
};

std::vector<commtree::Entity> load_inputs(const Options& opts) {
    commtree::EntityLoader loader(opts.config);
    if (opts.inputs.empty()) {
        return loader.load(std::cin);
    }

    std::vector<commtree::Entity> entities;
    for (const auto& path : opts.inputs) {
        auto part = path == "-" ? loader.load(std::cin) : loader.load(path);
        entities.insert(entities.end(),
                        std::make_move_iterator(part.begin()),
                        std::make_move_iterator(part.end()));
    }
    return entities;
}

int run(const Options& opts) {
    opts.config.validate();

    auto registry = commtree::FeatureRegistry::for_set(opts.config.features);
    auto entities = load_inputs(opts);
    if (entities.empty()) {
        std::fprintf(stderr, "No entities to process\n");
        return 1;
    }
    auto list = commtree::make_entity_list(entities);

    if (opts.tree_path.empty()) {
        // Training
        commtree::TreeBuilder builder(registry, opts.config);
        commtree::Tree tree = builder.fit(list);
        if (opts.config.verbosity > 0) {
            std::printf("\n");
            tree.dump(std::cout);
        }
        if (opts.output_path.empty()) {
            commtree::TreeCodec::save(tree, std::cout);
        } else {
            commtree::TreeCodec::save(tree, opts.output_path);
        }
    } else {
        // Testing
        commtree::Tree tree = commtree::TreeCodec::load(registry, opts.tree_path);
        auto report = commtree::Evaluator::score_all(tree, list);
        std::fputs(commtree::Evaluator::format_report(report).c_str(), stdout);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "-d") {
            opts.config.verbosity += 1;
        } else if (arg == "-t") {
            opts.config.features = commtree::FeatureSet::Targets;
        } else if (arg == "-V") {
            commtree::print_info();
            return 0;
        } else if (arg == "-h" || arg == "--help") {
            return usage(argv[0]);
        } else if (arg == "-m" && has_value) {
            try {
                int v = std::stoi(argv[++i]);
                if (v < 0) return usage(argv[0]);
                opts.config.builder.min_count = static_cast<commtree::Index>(v);
            } catch (const std::exception&) {
                return usage(argv[0]);
            }
        } else if (arg == "-e" && has_value) {
            try {
                opts.config.builder.min_entropy = std::stod(argv[++i]);
            } catch (const std::exception&) {
                return usage(argv[0]);
            }
        } else if (arg == "-k" && has_value) {
            opts.config.label_attribute = argv[++i];
        } else if (arg == "-f" && has_value) {
            opts.tree_path = argv[++i];
        } else if (arg == "-o" && has_value) {
            opts.output_path = argv[++i];
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            return usage(argv[0]);
        } else {
            opts.inputs.push_back(arg);
        }
    }

    try {
        return run(opts);
    } catch (const commtree::UnknownFeature& e) {
        std::fprintf(stderr, "%s (was the tree trained with %s?)\n", e.what(),
                     opts.config.features == commtree::FeatureSet::Targets ? "the category features"
                                                                          : "-t");
        return 1;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
