// craftcalc
// Resolves crafting chains over a recipe catalog: prints the per-branch
// ingredient tree of a request and the consolidated totals from the process
// simulator (raw costs, leftovers, and intermediate items processed).
//
// Build: cmake -S . -B build && cmake --build build
// Run:   ./build/craftcalc                  (demo requests)
//        ./build/craftcalc "Wooden Pickaxe" 11
//        ./build/craftcalc --json Cake 5
// --------------------------------------------------------------------

#include "CalculatorInfo.h"
#include "DefaultRecipes.h"
#include "IngredientTree.h"
#include "ProcessSimulator.h"
#include "ResultSerializer.h"
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static std::string join(const std::vector<Item>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i].to_string();
    }
    return out.empty() ? "-" : out;
}

static void calc(const RecipeGroup& recipes, const Item& item, const CalculatorInfo& info) {
    IngredientTree tree(item, recipes);
    CostsResult result = ProcessSimulator::get_total_costs(recipes, item);

    if (info.json) {
        ResultSerializer::serialize({item}, info.print_tree ? &tree : nullptr,
                                    info.print_costs ? &result : nullptr, std::cout);
        std::cout << "\n";
        return;
    }

    if (info.print_tree)
        std::printf("%s\n", tree.to_string().c_str());
    if (info.print_costs) {
        std::printf("Total costs: %s\n", join(result.total_costs).c_str());
        std::printf("Excess: %s\n", join(result.excess_items).c_str());
        std::printf("Intermediate history: %s\n", join(result.intermediate_history).c_str());
    }
    std::printf("\n");
}

// -------------------------
// Entry point
// -------------------------
int main(int argc, char** argv) {
    CalculatorInfo info;
    std::string error;
    if (!info.parse_args(argc, argv, error)) {
        std::fprintf(stderr, "%s\n%s\n", error.c_str(), CalculatorInfo::usage(argv[0]).c_str());
        return 1;
    }
    if (info.debug)
        std::printf("%s\n", info.to_json().c_str());

    RecipeGroup recipes = default_recipes();
    std::vector<Item> requests;
    if (info.target.empty())
        requests = demo_requests();
    else
        requests.emplace_back(info.target, info.quantity);

    try {
        for (const Item& item : requests) {
            calc(recipes, item, info);
        }
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
    return 0;
}
