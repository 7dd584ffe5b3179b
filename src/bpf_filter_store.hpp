// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "filter_store.hpp"
#include "result.hpp"
#include "types.hpp"

namespace netward {

struct BpfStoreConfig {
    std::string pin_root = kPinRoot;
    std::string lock_path = kApplyLockPath;
    uint32_t lock_timeout_ms = 5000;
    uint32_t max_filters = kMaxFiltersDefault;
};

// Owned map file descriptor.
class MapFd {
  public:
    MapFd() = default;
    explicit MapFd(int fd) : fd_(fd) {}
    ~MapFd();
    MapFd(MapFd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    MapFd& operator=(MapFd&& o) noexcept;
    MapFd(const MapFd&) = delete;
    MapFd& operator=(const MapFd&) = delete;
    [[nodiscard]] int fd() const { return fd_; }
    [[nodiscard]] explicit operator bool() const { return fd_ >= 0; }

  private:
    int fd_ = -1;
};

/**
 * Map syscalls used by the store.
 *
 * Every function follows the libbpf convention: 0 (or a new fd) on success,
 * -1 with errno set on failure. Defaults call into libbpf; tests swap in an
 * in-memory map table.
 */
struct BpfMapOps {
    int (*obj_get)(const char* path) = nullptr;
    int (*obj_pin)(int fd, const char* path) = nullptr;
    int (*map_create)(uint32_t type, const char* name, uint32_t key_size, uint32_t value_size,
                      uint32_t max_entries) = nullptr;
    int (*map_layout)(int fd, uint32_t* type, uint32_t* key_size, uint32_t* value_size) = nullptr;
    int (*lookup)(int fd, const void* key, void* value) = nullptr;
    int (*update)(int fd, const void* key, const void* value, uint64_t flags) = nullptr;
    int (*remove)(int fd, const void* key) = nullptr;
    int (*next_key)(int fd, const void* key, void* next_key) = nullptr;
    int (*close)(int fd) = nullptr;
};

/// Override map syscalls for testing. Null fields retain the libbpf defaults.
void set_bpf_map_ops_for_test(const BpfMapOps& ops);

/// Reset map syscalls to the libbpf defaults.
void reset_bpf_map_ops_for_test();

// One committed mutation, kept so the next transaction can rebuild its shadow map.
struct ShadowJournalOp {
    FilterKey key{};
    bool removed = false;
    BpfFilterRecord record{};
};

// What the last commit by this process changed, stamped with the meta
// generation that commit ran under. While no other writer has bumped the
// generation, the shadow map equals the live map minus these ops.
struct ShadowJournal {
    bool valid = false;
    uint64_t generation = 0;
    std::vector<ShadowJournalOp> ops;
};

BpfFilterRecord make_filter_record(const CompiledFilter& filter);
InstalledFilter installed_from_record(const FilterKey& key, const BpfFilterRecord& record);

/**
 * FilterStore over pinned eBPF maps.
 *
 * Two hash maps hold filter generations; a one-slot array names the live
 * one. A transaction brings the other map level with the live one, mutates
 * it and commits by flipping the slot, so the enforcement program sees
 * either the old or the new generation. Writers across processes are
 * serialized by an flock on lock_path.
 *
 * Leveling the shadow replays the journal of this process's previous
 * commit when the meta generation shows nobody else has written since;
 * otherwise the shadow is cleared and the live map copied in full.
 */
class BpfFilterStore final : public FilterStore {
  public:
    static Result<std::unique_ptr<BpfFilterStore>> open(const BpfStoreConfig& config);

    Result<std::vector<InstalledFilter>> enumerate_owned() override;
    Result<std::unique_ptr<FilterTransaction>> begin_transaction() override;

  private:
    BpfFilterStore(BpfStoreConfig config, MapFd map0, MapFd map1, MapFd slot, MapFd meta);

    Result<uint32_t> active_index() const;
    Result<FilterMeta> read_meta() const;
    Result<void> write_meta(const FilterMeta& meta);
    Result<void> level_shadow(uint32_t live_index, bool replay);
    [[nodiscard]] int map_fd(uint32_t index) const { return index == 0 ? map0_.fd() : map1_.fd(); }

    BpfStoreConfig config_;
    MapFd map0_;
    MapFd map1_;
    MapFd slot_;
    MapFd meta_;
    ShadowJournal journal_;
};

Result<void> bump_memlock_rlimit();

BpfStoreConfig store_config_from_engine(const EngineConfig& cfg);
Result<std::unique_ptr<FilterStore>> open_bpf_filter_store(const EngineConfig& cfg);

} // namespace netward
