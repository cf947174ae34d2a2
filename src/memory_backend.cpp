#include "memory_backend.hpp"

namespace graphkv
{

  std::map<std::string, std::string, std::less<>> &MemoryBackend::table(Partition p)
  {
    if (closed_)
      throw BackendError("memory backend is closed");
    return data_[index(p)];
  }

  std::optional<std::string> MemoryBackend::get(Partition p, std::string_view key)
  {
    auto &t = table(p);
    stats_[index(p)].gets++;
    auto it = t.find(key);
    if (it == t.end())
      return std::nullopt;
    return it->second;
  }

  void MemoryBackend::put(Partition p, std::string_view key, std::string_view value)
  {
    auto &t = table(p);
    stats_[index(p)].puts++;
    t.insert_or_assign(std::string(key), std::string(value));
  }

  void MemoryBackend::remove(Partition p, std::string_view key)
  {
    auto &t = table(p);
    stats_[index(p)].removes++;
    auto it = t.find(key);
    if (it != t.end())
      t.erase(it);
  }

  KeyValueMap MemoryBackend::multiGet(Partition p, const std::vector<std::string> &keys)
  {
    auto &t = table(p);
    stats_[index(p)].multiGets++;
    KeyValueMap out;
    for (const auto &k : keys)
    {
      auto it = t.find(k);
      if (it != t.end())
        out.emplace(k, it->second);
    }
    return out;
  }

  void MemoryBackend::multiPut(Partition p, const KeyValueMap &entries)
  {
    auto &t = table(p);
    stats_[index(p)].multiPuts++;
    for (const auto &[k, v] : entries)
      t.insert_or_assign(k, v);
  }

  void MemoryBackend::rangeIterate(Partition p, std::string_view start, std::string_view end, const RangeCallback &fn)
  {
    auto &t = table(p);
    stats_[index(p)].rangeScans++;
    for (auto it = t.lower_bound(start); it != t.end(); ++it)
    {
      if (!end.empty() && std::string_view(it->first) >= end)
        break;
      if (!fn(it->first, it->second))
        break;
    }
  }

  void MemoryBackend::close()
  {
    if (closed_)
      return;
    closed_ = true;
    for (auto &t : data_)
      t.clear();
  }

} // namespace graphkv
