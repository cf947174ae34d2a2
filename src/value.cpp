#include "value.hpp"

namespace graphkv
{

  const char *typeName(const Value &v)
  {
    switch (v.v.index())
    {
    case 0:
      return "null";
    case 1:
      return "bool";
    case 2:
      return "int";
    case 3:
      return "double";
    case 4:
      return "string";
    case 5:
      return "list";
    case 6:
      return "map";
    default:
      return "unknown";
    }
  }

} // namespace graphkv
