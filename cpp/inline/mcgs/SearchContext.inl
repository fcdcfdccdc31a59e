#include "mcgs/SearchContext.hpp"

namespace mcgs {

template <mcgs::concepts::Traits Traits>
void SearchContext<Traits>::init(vertex_index_t root_vertex, epoch_t e) {
  root = root_vertex;
  epoch = e;
  stats = RoundStats();
  start_pass();
}

template <mcgs::concepts::Traits Traits>
void SearchContext<Traits>::start_pass() {
  search_path.clear();
  touched_edges.clear();
  backprop_vertices.clear();
  backprop_edges.clear();
}

template <mcgs::concepts::Traits Traits>
std::string SearchContext<Traits>::search_path_str(const SearchGraph& graph) const {
  std::string delim = "";
  std::string s = "[";
  for (edge_index_t e : search_path) {
    s += delim + Game::IO::action_to_str(graph.edge(e).action);
    delim = ", ";
  }
  s += "]";
  return s;
}

}  // namespace mcgs
