#include "ResultSerializer.h"
#include "JsonUtil.h"

void ResultSerializer::serialize(const std::vector<Item>& request, const IngredientTree* tree,
                                 const CostsResult* costs, std::ostream& out) {
    out << "{\n";
    out << "  \"request\": " << json_array(request);
    if (tree) {
        out << ",\n  \"tree\": " << tree->to_json();
    }
    if (costs) {
        out << ",\n  \"total_costs\": " << json_array(costs->total_costs);
        out << ",\n  \"excess_items\": " << json_array(costs->excess_items);
        out << ",\n  \"intermediate_history\": " << json_array(costs->intermediate_history);
    }
    out << "\n}";
}
