#include <funcstructs/debug_log.hpp>
#include <funcstructs/errors.hpp>
#include <funcstructs/forests.hpp>
#include <funcstructs/necklaces.hpp>
#include <funcstructs/partitions.hpp>
#include <funcstructs/rooted_trees.hpp>
#include <funcstructs/structures.hpp>
#include <algorithm>
#include <cstdio>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

using namespace funcstructs;

namespace {

struct EnumerationConfig {
    std::string kind = "structures";
    std::size_t nodes = 4;
    std::size_t parts = 2;
    std::optional<CycleType> cycle_type;
    std::vector<std::size_t> multiplicities;
    std::vector<Part> tree_sizes;
    bool count_only = false;
    bool debug = false;
};

std::size_t parse_count(const std::string& flag, const std::string& text) {
    long long value = 0;
    std::size_t consumed = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw InvalidParameter(flag + " expects an integer, received '" + text + "'");
    }
    if (consumed != text.size()) {
        throw InvalidParameter(flag + " expects an integer, received '" + text + "'");
    }
    if (value < 0) {
        throw InvalidParameter(flag + " must not be negative, received " + text);
    }
    return static_cast<std::size_t>(value);
}

std::vector<std::size_t> parse_list(const std::string& flag, const std::string& text) {
    std::vector<std::size_t> values;
    std::size_t start = 0;
    while (start <= text.size() && !text.empty()) {
        std::size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        values.push_back(parse_count(flag, text.substr(start, comma - start)));
        start = comma + 1;
    }
    return values;
}

// Partitions are stored largest part first; accept the parts in any order.
std::vector<Part> parse_parts(const std::string& flag, const std::string& text) {
    std::vector<Part> parts = parse_list(flag, text);
    std::sort(parts.begin(), parts.end(), std::greater<Part>());
    return parts;
}

void print_usage() {
    printf("Usage: funcstructs_enum [options]\n");
    printf("  --kind=trees|partitions|necklaces|forests|structures\n");
    printf("  --nodes=N              node count (trees, structures) or total (partitions)\n");
    printf("  --parts=L              number of parts (partitions)\n");
    printf("  --cycle-type=a,b,...   restrict structures to these cycle lengths\n");
    printf("  --multiplicities=a,... symbol multiplicities (necklaces)\n");
    printf("  --tree-sizes=a,b,...   tree sizes, largest first (forests)\n");
    printf("  --count-only           print only the number of objects\n");
    printf("  --debug                route debug output to stderr\n");
}

void debug_to_stderr(const char* message) {
    fprintf(stderr, "%s\n", message);
}

template<typename Generator, typename Print>
std::size_t drain(Generator generator, bool count_only, Print print) {
    std::size_t count = 0;
    while (auto value = generator.next()) {
        if (!count_only) {
            print(*value);
        }
        ++count;
    }
    return count;
}

std::size_t run(const EnumerationConfig& config) {
    if (config.kind == "trees") {
        return drain(TreeGenerator(config.nodes), config.count_only, [](const DominantSequence& tree) {
            printf("%s\n", tree.to_string().c_str());
        });
    }
    if (config.kind == "partitions") {
        return drain(PartitionGenerator(config.nodes, config.parts), config.count_only,
                     [](const Partition& p) { printf("%s\n", p.to_string().c_str()); });
    }
    if (config.kind == "necklaces") {
        return drain(NecklaceGenerator(config.multiplicities), config.count_only,
                     [](const Necklace<Symbol>& necklace) {
            std::string text = "(";
            for (std::size_t i = 0; i < necklace.size(); ++i) {
                text += std::to_string(necklace[i]);
                if (i < necklace.size() - 1) text += ", ";
            }
            printf("%s)\n", text.c_str());
        });
    }
    if (config.kind == "forests") {
        return drain(ForestGenerator(Partition(config.tree_sizes)), config.count_only,
                     [](const Forest& forest) { printf("%s\n", forest.to_string().c_str()); });
    }
    if (config.kind == "structures") {
        return drain(StructureGenerator(config.nodes, config.cycle_type), config.count_only,
                     [](const EndofunctionStructure& s) { printf("%s\n", s.to_string().c_str()); });
    }
    throw InvalidParameter("unknown kind '" + config.kind + "'");
}

} // namespace

int main(int argc, char** argv) {
    EnumerationConfig config;

    // Parse arguments
    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--help") {
                print_usage();
                return 0;
            } else if (arg == "--count-only") {
                config.count_only = true;
            } else if (arg == "--debug") {
                config.debug = true;
            } else if (arg.find("--kind=") == 0) {
                config.kind = arg.substr(7);
            } else if (arg.find("--nodes=") == 0) {
                config.nodes = parse_count("--nodes", arg.substr(8));
            } else if (arg.find("--parts=") == 0) {
                config.parts = parse_count("--parts", arg.substr(8));
            } else if (arg.find("--cycle-type=") == 0) {
                config.cycle_type = CycleType(parse_parts("--cycle-type", arg.substr(13)));
            } else if (arg.find("--multiplicities=") == 0) {
                config.multiplicities = parse_list("--multiplicities", arg.substr(17));
            } else if (arg.find("--tree-sizes=") == 0) {
                config.tree_sizes = parse_parts("--tree-sizes", arg.substr(13));
            } else {
                fprintf(stderr, "Unknown option: %s\n", arg.c_str());
                print_usage();
                return 2;
            }
        }

        if (config.debug) {
            debug::set_debug_callback(debug_to_stderr);
        }

        const std::size_t count = run(config);
        printf("%zu %s\n", count, config.kind.c_str());
    } catch (const InvalidParameter& e) {
        fprintf(stderr, "%s\n", e.what());
        return 2;
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
