#ifndef RESULT_SERIALIZER_H
#define RESULT_SERIALIZER_H

#include "IngredientTree.h"
#include "Item.h"
#include "ProcessSimulator.h"
#include <ostream>
#include <vector>

class ResultSerializer {
public:
    /**
     * Serializes a request, its ingredient tree and its simulated costs to a JSON stream.
     * @param request The requested items.
     * @param tree The ingredient tree of the request, or nullptr to leave it out.
     * @param costs The simulated costs, or nullptr to leave them out.
     * @param out The output stream to write JSON to.
     */
    static void serialize(const std::vector<Item>& request, const IngredientTree* tree,
                          const CostsResult* costs, std::ostream& out);
};

#endif // RESULT_SERIALIZER_H
