#include "backend.hpp"

namespace graphkv
{

  const char *partitionName(Partition p)
  {
    switch (p)
    {
    case Partition::Nodes:
      return "nodes";
    case Partition::Edges:
      return "edges";
    case Partition::Adjacency:
      return "adjacency";
    }
    return "unknown";
  }

} // namespace graphkv
