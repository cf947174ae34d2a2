#pragma once
#include "backend.hpp"
#include <array>
#include <cstdint>

namespace graphkv
{

  // call counters, one per Backend operation
  struct BackendStats
  {
    uint64_t gets{0};
    uint64_t puts{0};
    uint64_t removes{0};
    uint64_t multiGets{0};
    uint64_t multiPuts{0};
    uint64_t rangeScans{0};
  };

  // In-process Backend over ordered maps. Used by tests and as a scratch store.
  class MemoryBackend final : public Backend
  {
  public:
    MemoryBackend() = default;

    std::optional<std::string> get(Partition p, std::string_view key) override;
    void put(Partition p, std::string_view key, std::string_view value) override;
    void remove(Partition p, std::string_view key) override;
    KeyValueMap multiGet(Partition p, const std::vector<std::string> &keys) override;
    void multiPut(Partition p, const KeyValueMap &entries) override;
    void rangeIterate(Partition p, std::string_view start, std::string_view end, const RangeCallback &fn) override;
    void close() override;

    BackendStats stats(Partition p) const { return stats_[index(p)]; }
    void resetStats() { stats_ = {}; }
    size_t size(Partition p) const { return data_[index(p)].size(); }
    bool closed() const { return closed_; }

  private:
    static size_t index(Partition p) { return static_cast<size_t>(p); }
    std::map<std::string, std::string, std::less<>> &table(Partition p);

    std::array<std::map<std::string, std::string, std::less<>>, 3> data_{};
    std::array<BackendStats, 3> stats_{};
    bool closed_{false};
  };

} // namespace graphkv
