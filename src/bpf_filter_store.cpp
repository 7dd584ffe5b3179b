// cppcheck-suppress-file missingIncludeSystem
#include "bpf_filter_store.hpp"

#include <arpa/inet.h>
#include <bpf/bpf.h>
#include <bpf/libbpf.h>
#include <sys/resource.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <utility>

#include "file_lock.hpp"
#include "logging.hpp"
#include "tracing.hpp"

namespace netward {

namespace {

constexpr uint32_t kSlotKey = 0;

int sys_obj_get(const char* path)
{
    return bpf_obj_get(path);
}

int sys_obj_pin(int fd, const char* path)
{
    return bpf_obj_pin(fd, path);
}

int sys_map_create(uint32_t type, const char* name, uint32_t key_size, uint32_t value_size, uint32_t max_entries)
{
    return bpf_map_create(static_cast<bpf_map_type>(type), name, key_size, value_size, max_entries, nullptr);
}

int sys_map_layout(int fd, uint32_t* type, uint32_t* key_size, uint32_t* value_size)
{
    bpf_map_info info{};
    uint32_t info_len = sizeof(info);
    if (bpf_obj_get_info_by_fd(fd, &info, &info_len) != 0) {
        return -1;
    }
    *type = info.type;
    *key_size = info.key_size;
    *value_size = info.value_size;
    return 0;
}

int sys_lookup(int fd, const void* key, void* value)
{
    return bpf_map_lookup_elem(fd, key, value);
}

int sys_update(int fd, const void* key, const void* value, uint64_t flags)
{
    return bpf_map_update_elem(fd, key, value, flags);
}

int sys_remove(int fd, const void* key)
{
    return bpf_map_delete_elem(fd, key);
}

int sys_next_key(int fd, const void* key, void* next_key)
{
    return bpf_map_get_next_key(fd, key, next_key);
}

int sys_close(int fd)
{
    return ::close(fd);
}

BpfMapOps make_default_map_ops()
{
    BpfMapOps ops;
    ops.obj_get = sys_obj_get;
    ops.obj_pin = sys_obj_pin;
    ops.map_create = sys_map_create;
    ops.map_layout = sys_map_layout;
    ops.lookup = sys_lookup;
    ops.update = sys_update;
    ops.remove = sys_remove;
    ops.next_key = sys_next_key;
    ops.close = sys_close;
    return ops;
}

BpfMapOps g_ops = make_default_map_ops();

Error map_error(int err, const std::string& message)
{
    if (err == EEXIST) {
        return Error(ErrorCode::ResourceExists, message, std::strerror(err));
    }
    if (err == ENOENT) {
        return Error(ErrorCode::ResourceNotFound, message, std::strerror(err));
    }
    return Error(ErrorCode::BpfMapOperationFailed, message, std::strerror(err));
}

Result<MapFd> open_or_create_map(const std::string& path, bpf_map_type type, const char* name, uint32_t key_size,
                                 uint32_t value_size, uint32_t max_entries, bool& created)
{
    created = false;
    int fd = g_ops.obj_get(path.c_str());
    if (fd >= 0) {
        MapFd map(fd);
        uint32_t found_type = 0;
        uint32_t found_key_size = 0;
        uint32_t found_value_size = 0;
        if (g_ops.map_layout(fd, &found_type, &found_key_size, &found_value_size) != 0) {
            return map_error(errno, "Failed to query pinned map " + path);
        }
        if (found_type != static_cast<uint32_t>(type) || found_key_size != key_size ||
            found_value_size != value_size) {
            return Error(ErrorCode::BpfLayoutMismatch, "Pinned map has an incompatible layout", path);
        }
        return map;
    }
    if (errno != ENOENT) {
        return Error::system(errno, "Failed to open pinned map " + path);
    }

    fd = g_ops.map_create(static_cast<uint32_t>(type), name, key_size, value_size, max_entries);
    if (fd < 0) {
        return map_error(errno, std::string("Failed to create map ") + name);
    }
    MapFd map(fd);
    if (g_ops.obj_pin(fd, path.c_str()) != 0) {
        return map_error(errno, "Failed to pin map at " + path);
    }
    created = true;
    logger().log(SLOG_INFO("Created pinned map").field("path", path).field("max_entries", static_cast<int64_t>(max_entries)));
    return map;
}

Result<void> clear_map(int fd)
{
    FilterKey key{};
    while (g_ops.next_key(fd, nullptr, key.data()) == 0) {
        if (g_ops.remove(fd, key.data()) != 0 && errno != ENOENT) {
            return map_error(errno, "Failed to clear filter map");
        }
    }
    if (errno != ENOENT) {
        return map_error(errno, "Failed to iterate filter map");
    }
    return {};
}

Result<void> copy_map(int src_fd, int dst_fd)
{
    FilterKey key{};
    FilterKey next{};
    BpfFilterRecord record{};
    const void* prev = nullptr;
    while (g_ops.next_key(src_fd, prev, next.data()) == 0) {
        if (g_ops.lookup(src_fd, next.data(), &record) == 0) {
            if (g_ops.update(dst_fd, next.data(), &record, BPF_ANY) != 0) {
                return map_error(errno, "Failed to copy live filter into shadow map");
            }
        } else if (errno != ENOENT) {
            return map_error(errno, "Failed to read live filter");
        }
        key = next;
        prev = key.data();
    }
    if (errno != ENOENT) {
        return map_error(errno, "Failed to iterate live filter map");
    }
    return {};
}

Result<void> replay_journal(int shadow_fd, const ShadowJournal& journal)
{
    for (const auto& op : journal.ops) {
        if (op.removed) {
            if (g_ops.remove(shadow_fd, op.key.data()) != 0 && errno != ENOENT) {
                return map_error(errno, "Failed to replay removal of " + filter_key_hex(op.key));
            }
        } else if (g_ops.update(shadow_fd, op.key.data(), &op.record, BPF_ANY) != 0) {
            return map_error(errno, "Failed to replay write of " + filter_key_hex(op.key));
        }
    }
    return {};
}

class BpfFilterTransaction final : public FilterTransaction {
  public:
    BpfFilterTransaction(ScopedFileLock lock, int shadow_fd, int slot_fd, uint32_t shadow_index,
                         ShadowJournal& journal, uint64_t generation)
        : lock_(std::move(lock)), shadow_fd_(shadow_fd), slot_fd_(slot_fd), shadow_index_(shadow_index),
          journal_(journal), generation_(generation)
    {
    }

    ~BpfFilterTransaction() override
    {
        if (!finished_) {
            auto result = abort();
            if (!result) {
                logger().log(SLOG_WARN("Failed to discard uncommitted shadow map")
                                 .field("error", result.error().to_string()));
            }
        }
    }

    Result<void> add(const CompiledFilter& filter) override
    {
        if (finished_) {
            return Error(ErrorCode::InvalidArgument, "Transaction already finished");
        }
        const BpfFilterRecord record = make_filter_record(filter);
        if (g_ops.update(shadow_fd_, filter.key.data(), &record, BPF_NOEXIST) != 0) {
            return map_error(errno, "Failed to add filter " + filter_key_hex(filter.key) + " (" + filter.rule_id + ")");
        }
        ops_.push_back(ShadowJournalOp{filter.key, false, record});
        return {};
    }

    Result<void> update(const CompiledFilter& filter) override
    {
        if (finished_) {
            return Error(ErrorCode::InvalidArgument, "Transaction already finished");
        }
        const BpfFilterRecord record = make_filter_record(filter);
        if (g_ops.update(shadow_fd_, filter.key.data(), &record, BPF_EXIST) != 0) {
            return map_error(errno, "Failed to update filter " + filter_key_hex(filter.key) + " (" + filter.rule_id + ")");
        }
        ops_.push_back(ShadowJournalOp{filter.key, false, record});
        return {};
    }

    Result<void> remove(const FilterKey& key) override
    {
        if (finished_) {
            return Error(ErrorCode::InvalidArgument, "Transaction already finished");
        }
        if (g_ops.remove(shadow_fd_, key.data()) != 0) {
            return map_error(errno, "Failed to remove filter " + filter_key_hex(key));
        }
        ops_.push_back(ShadowJournalOp{key, true, BpfFilterRecord{}});
        return {};
    }

    Result<void> commit() override
    {
        if (finished_) {
            return Error(ErrorCode::InvalidArgument, "Transaction already finished");
        }
        // Single array slot write: the enforcement program switches generations atomically.
        if (g_ops.update(slot_fd_, &kSlotKey, &shadow_index_, BPF_ANY) != 0) {
            return map_error(errno, "Failed to publish filter generation");
        }
        finished_ = true;
        // The map just retired is the previous live one; these ops level it again.
        journal_.ops = std::move(ops_);
        journal_.generation = generation_;
        journal_.valid = true;
        lock_.release();
        return {};
    }

    Result<void> abort() override
    {
        if (finished_) {
            return {};
        }
        finished_ = true;
        auto result = clear_map(shadow_fd_);
        lock_.release();
        return result;
    }

  private:
    ScopedFileLock lock_;
    int shadow_fd_;
    int slot_fd_;
    uint32_t shadow_index_;
    ShadowJournal& journal_;
    uint64_t generation_;
    std::vector<ShadowJournalOp> ops_;
    bool finished_ = false;
};

} // namespace

void set_bpf_map_ops_for_test(const BpfMapOps& ops)
{
    const BpfMapOps defaults = make_default_map_ops();
    g_ops.obj_get = ops.obj_get ? ops.obj_get : defaults.obj_get;
    g_ops.obj_pin = ops.obj_pin ? ops.obj_pin : defaults.obj_pin;
    g_ops.map_create = ops.map_create ? ops.map_create : defaults.map_create;
    g_ops.map_layout = ops.map_layout ? ops.map_layout : defaults.map_layout;
    g_ops.lookup = ops.lookup ? ops.lookup : defaults.lookup;
    g_ops.update = ops.update ? ops.update : defaults.update;
    g_ops.remove = ops.remove ? ops.remove : defaults.remove;
    g_ops.next_key = ops.next_key ? ops.next_key : defaults.next_key;
    g_ops.close = ops.close ? ops.close : defaults.close;
}

void reset_bpf_map_ops_for_test()
{
    g_ops = make_default_map_ops();
}

MapFd::~MapFd()
{
    if (fd_ >= 0) {
        g_ops.close(fd_);
    }
}

MapFd& MapFd::operator=(MapFd&& o) noexcept
{
    if (this != &o) {
        if (fd_ >= 0) {
            g_ops.close(fd_);
        }
        fd_ = o.fd_;
        o.fd_ = -1;
    }
    return *this;
}

BpfFilterRecord make_filter_record(const CompiledFilter& filter)
{
    BpfFilterRecord r{};
    r.owner_magic = kOwnerMagic;
    r.layout_version = kLayoutVersion;
    r.weight = filter.weight;
    r.layer = static_cast<uint8_t>(filter.layer);
    r.action = static_cast<uint8_t>(filter.action);
    r.protocol = static_cast<uint8_t>(filter.protocol);
    uint8_t flags = 0;
    if (filter.has_local_address) {
        flags |= FILTER_HAS_LOCAL_ADDR;
        r.local_addr = htonl(filter.local_address);
        r.local_mask = htonl(filter.local_mask);
    }
    if (filter.has_remote_address) {
        flags |= FILTER_HAS_REMOTE_ADDR;
        r.remote_addr = htonl(filter.remote_address);
        r.remote_mask = htonl(filter.remote_mask);
    }
    if (filter.has_local_ports) {
        flags |= FILTER_HAS_LOCAL_PORTS;
        r.local_port_lo = filter.local_ports.low;
        r.local_port_hi = filter.local_ports.high;
    }
    if (filter.has_remote_ports) {
        flags |= FILTER_HAS_REMOTE_PORTS;
        r.remote_port_lo = filter.remote_ports.low;
        r.remote_port_hi = filter.remote_ports.high;
    }
    if (!filter.process.empty()) {
        flags |= FILTER_HAS_PROCESS;
        std::strncpy(r.process, filter.process.c_str(), sizeof(r.process) - 1);
    }
    if (filter.is_default) {
        flags |= FILTER_IS_DEFAULT;
    }
    r.flags = flags;
    std::strncpy(r.rule_id, filter.rule_id.c_str(), sizeof(r.rule_id) - 1);
    return r;
}

InstalledFilter installed_from_record(const FilterKey& key, const BpfFilterRecord& record)
{
    InstalledFilter f;
    f.key = key;
    f.rule_id = std::string(record.rule_id, strnlen(record.rule_id, sizeof(record.rule_id)));
    f.layer = record.layer == static_cast<uint8_t>(FilterLayer::Accept4) ? FilterLayer::Accept4 : FilterLayer::Connect4;
    f.action = record.action == static_cast<uint8_t>(Action::Allow) ? Action::Allow : Action::Block;
    f.weight = record.weight;
    return f;
}

BpfFilterStore::BpfFilterStore(BpfStoreConfig config, MapFd map0, MapFd map1, MapFd slot, MapFd meta)
    : config_(std::move(config)), map0_(std::move(map0)), map1_(std::move(map1)), slot_(std::move(slot)),
      meta_(std::move(meta))
{
}

Result<std::unique_ptr<BpfFilterStore>> BpfFilterStore::open(const BpfStoreConfig& config)
{
    ScopedSpan span("store.open", current_trace_id(), current_span_id());
    auto fail = [&](const Error& err) -> Result<std::unique_ptr<BpfFilterStore>> {
        span.fail(err.to_string());
        return err;
    };

    auto memlock = bump_memlock_rlimit();
    if (!memlock) {
        logger().log(SLOG_WARN("Failed to raise RLIMIT_MEMLOCK").field("error", memlock.error().to_string()));
    }

    std::error_code ec;
    std::filesystem::create_directories(config.pin_root, ec);
    if (ec) {
        return fail(Error(ErrorCode::IoError, "Failed to create pin directory", config.pin_root + ": " + ec.message()));
    }

    const std::filesystem::path root(config.pin_root);
    bool created = false;
    auto map0 = open_or_create_map((root / kFilterMapPinName0).string(), BPF_MAP_TYPE_HASH, kFilterMapPinName0,
                                   sizeof(FilterKey), sizeof(BpfFilterRecord), config.max_filters, created);
    if (!map0) {
        return fail(map0.error());
    }
    auto map1 = open_or_create_map((root / kFilterMapPinName1).string(), BPF_MAP_TYPE_HASH, kFilterMapPinName1,
                                   sizeof(FilterKey), sizeof(BpfFilterRecord), config.max_filters, created);
    if (!map1) {
        return fail(map1.error());
    }
    auto slot = open_or_create_map((root / kFilterSlotPinName).string(), BPF_MAP_TYPE_ARRAY, kFilterSlotPinName,
                                   sizeof(uint32_t), sizeof(uint32_t), 1, created);
    if (!slot) {
        return fail(slot.error());
    }
    bool meta_created = false;
    auto meta = open_or_create_map((root / kMetaPinName).string(), BPF_MAP_TYPE_ARRAY, kMetaPinName, sizeof(uint32_t),
                                   sizeof(FilterMeta), 1, meta_created);
    if (!meta) {
        return fail(meta.error());
    }

    FilterMeta current{};
    if (g_ops.lookup(meta->fd(), &kSlotKey, &current) != 0) {
        return fail(map_error(errno, "Failed to read filter store metadata"));
    }
    if (meta_created || current.layout_version == 0) {
        const FilterMeta fresh{kLayoutVersion, kOwnerMagic, 0};
        if (g_ops.update(meta->fd(), &kSlotKey, &fresh, BPF_ANY) != 0) {
            return fail(map_error(errno, "Failed to write filter store metadata"));
        }
    } else if (current.layout_version != kLayoutVersion || current.owner_magic != kOwnerMagic) {
        return fail(Error(ErrorCode::BpfLayoutMismatch, "Pinned filter store layout mismatch",
                          "found version " + std::to_string(current.layout_version) + ", expected " +
                              std::to_string(kLayoutVersion)));
    }

    return std::unique_ptr<BpfFilterStore>(new BpfFilterStore(config, std::move(*map0), std::move(*map1),
                                                              std::move(*slot), std::move(*meta)));
}

Result<uint32_t> BpfFilterStore::active_index() const
{
    uint32_t index = 0;
    if (g_ops.lookup(slot_.fd(), &kSlotKey, &index) != 0) {
        return map_error(errno, "Failed to read active filter generation");
    }
    if (index > 1) {
        return Error(ErrorCode::BpfLayoutMismatch, "Active filter generation out of range", std::to_string(index));
    }
    return index;
}

Result<std::vector<InstalledFilter>> BpfFilterStore::enumerate_owned()
{
    auto index = active_index();
    if (!index) {
        return index.error();
    }
    const int fd = map_fd(*index);

    std::vector<InstalledFilter> out;
    FilterKey key{};
    FilterKey next{};
    BpfFilterRecord record{};
    const void* prev = nullptr;
    size_t foreign = 0;
    while (g_ops.next_key(fd, prev, next.data()) == 0) {
        if (g_ops.lookup(fd, next.data(), &record) == 0) {
            if (record.owner_magic == kOwnerMagic && record.layout_version == kLayoutVersion) {
                out.push_back(installed_from_record(next, record));
            } else {
                ++foreign;
            }
        } else if (errno != ENOENT) {
            return map_error(errno, "Failed to read installed filter");
        }
        key = next;
        prev = key.data();
    }
    if (errno != ENOENT) {
        return map_error(errno, "Failed to enumerate installed filters");
    }
    if (foreign > 0) {
        logger().log(SLOG_DEBUG("Skipped filters without owner tag").field("count", static_cast<int64_t>(foreign)));
    }
    return out;
}

Result<FilterMeta> BpfFilterStore::read_meta() const
{
    FilterMeta meta{};
    if (g_ops.lookup(meta_.fd(), &kSlotKey, &meta) != 0) {
        return map_error(errno, "Failed to read filter store metadata");
    }
    return meta;
}

Result<void> BpfFilterStore::write_meta(const FilterMeta& meta)
{
    if (g_ops.update(meta_.fd(), &kSlotKey, &meta, BPF_ANY) != 0) {
        return map_error(errno, "Failed to write filter store metadata");
    }
    return {};
}

Result<void> BpfFilterStore::level_shadow(uint32_t live_index, bool replay)
{
    const int shadow_fd = map_fd(1 - live_index);
    if (replay) {
        auto replayed = replay_journal(shadow_fd, journal_);
        if (replayed) {
            logger().log(SLOG_DEBUG("Shadow map leveled from journal").field("ops", journal_.ops.size()));
            return {};
        }
        logger().log(SLOG_WARN("Journal replay failed; copying live map")
                         .field("error", replayed.error().to_string()));
    }

    TRY(clear_map(shadow_fd));
    auto copied = copy_map(map_fd(live_index), shadow_fd);
    if (!copied) {
        auto cleared = clear_map(shadow_fd);
        if (!cleared) {
            logger().log(SLOG_WARN("Failed to clear partially copied shadow map")
                             .field("error", cleared.error().to_string()));
        }
        return copied.error();
    }
    logger().log(SLOG_DEBUG("Shadow map leveled by full copy"));
    return {};
}

Result<std::unique_ptr<FilterTransaction>> BpfFilterStore::begin_transaction()
{
    auto lock = ScopedFileLock::acquire(config_.lock_path, config_.lock_timeout_ms);
    if (!lock) {
        if (lock.error().code() == ErrorCode::ResourceBusy) {
            return Error(ErrorCode::TransactionUnavailable, "Filter store is locked by another writer",
                         lock.error().to_string());
        }
        return lock.error();
    }

    auto index = active_index();
    if (!index) {
        return index.error();
    }
    auto meta = read_meta();
    if (!meta) {
        return meta.error();
    }
    const uint64_t observed = meta->generation;
    const bool replay = journal_.valid && journal_.generation == observed;

    // Claim the shadow before touching it so a journal held by any other
    // process stops matching, even if this one dies halfway.
    journal_.valid = false;
    FilterMeta claimed = *meta;
    claimed.generation = observed + 1;
    TRY(write_meta(claimed));
    TRY(level_shadow(*index, replay));

    const uint32_t shadow_index = 1 - *index;
    return std::unique_ptr<FilterTransaction>(new BpfFilterTransaction(
        std::move(*lock), map_fd(shadow_index), slot_.fd(), shadow_index, journal_, claimed.generation));
}

BpfStoreConfig store_config_from_engine(const EngineConfig& cfg)
{
    BpfStoreConfig config;
    config.pin_root = cfg.pin_root;
    config.lock_path = cfg.lock_path;
    config.lock_timeout_ms = cfg.tx_lock_timeout_ms;
    config.max_filters = cfg.max_filters;
    return config;
}

Result<std::unique_ptr<FilterStore>> open_bpf_filter_store(const EngineConfig& cfg)
{
    auto store = BpfFilterStore::open(store_config_from_engine(cfg));
    if (!store) {
        return store.error();
    }
    return std::unique_ptr<FilterStore>(std::move(*store));
}

Result<void> bump_memlock_rlimit()
{
    rlimit rl{};
    rl.rlim_cur = RLIM_INFINITY;
    rl.rlim_max = RLIM_INFINITY;
    if (::setrlimit(RLIMIT_MEMLOCK, &rl) != 0) {
        return Error::system(errno, "setrlimit(RLIMIT_MEMLOCK) failed");
    }
    return {};
}

} // namespace netward
