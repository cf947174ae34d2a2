#pragma once
#include <stdexcept>

namespace graphkv
{

  // storage engine failure, or use after close
  struct BackendError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // corrupt or incompatible payload bytes
  struct SerializationError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

} // namespace graphkv
