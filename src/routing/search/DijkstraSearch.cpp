#include "DijkstraSearch.h"
#include "SearchCommon.h"

namespace accessroute {
namespace search {

SearchResult DijkstraSearch::find(const WeightedGraph& weighted,
                                  NodeId origin,
                                  NodeId destination,
                                  SearchContext& context) const {
    return bestFirstSearch(weighted, origin, destination, context,
                           [](NodeId) { return 0.0; });
}

}  // namespace search
}  // namespace accessroute
