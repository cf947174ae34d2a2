#pragma once
#include "backend.hpp"
#include "errors.hpp"
#include <filesystem>
#include <memory>

namespace leveldb
{
  class DB;
}

namespace graphkv
{

  struct LevelDbError : BackendError
  {
    using BackendError::BackendError;
  };

  struct LevelDbOptions
  {
    std::filesystem::path path{"data-leveldb"};
    size_t writeBufferBytes{size_t(4) << 20};
    // fsync every write
    bool sync{false};
  };

  // Backend over one LevelDB database. The partitions share its keyspace under
  // the prefixes "N:", "E:" and "A:", so a range scan is an iterator bounded by
  // the partition prefix. multiPut is a single WriteBatch and multiGet reads
  // from one snapshot.
  //
  // A rangeIterate callback may read or write through the backend but must not
  // close it.
  class LevelDbBackend final : public Backend
  {
  public:
    explicit LevelDbBackend(const LevelDbOptions &options);
    ~LevelDbBackend() override;

    LevelDbBackend(const LevelDbBackend &) = delete;
    LevelDbBackend &operator=(const LevelDbBackend &) = delete;

    std::optional<std::string> get(Partition p, std::string_view key) override;
    void put(Partition p, std::string_view key, std::string_view value) override;
    void remove(Partition p, std::string_view key) override;
    KeyValueMap multiGet(Partition p, const std::vector<std::string> &keys) override;
    void multiPut(Partition p, const KeyValueMap &entries) override;
    void rangeIterate(Partition p, std::string_view start, std::string_view end, const RangeCallback &fn) override;
    void close() override;

  private:
    leveldb::DB &db();

    LevelDbOptions options_;
    std::unique_ptr<leveldb::DB> db_;
  };

} // namespace graphkv
