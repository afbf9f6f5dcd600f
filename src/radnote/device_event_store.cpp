#include "radnote/device_event_store.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

namespace radnote {

DeviceEventStore::DeviceEventStore(std::filesystem::path snapshot_path)
    : path_snapshot_(std::move(snapshot_path)),
      logger_(get_logger()) {}

const std::filesystem::path& DeviceEventStore::snapshot_path() const noexcept {
    return path_snapshot_;
}

void DeviceEventStore::ensure_loaded() {
    if (flag_loaded_.load(std::memory_order_acquire)) {
        return;
    }
    std::scoped_lock lock(mutex_);
    load_locked();
}

bool DeviceEventStore::record_event(const TelemetryEnvelope& envelope) {
    if (!envelope.is_radiation_reading()) {
        logger_->debug("Ignoring {} event from {}", envelope.notefile_kind, envelope.device_id);
        return false;
    }

    std::scoped_lock lock(mutex_);
    load_locked();

    const auto iterator_record = map_records_.find(envelope.device_id);
    if (iterator_record != map_records_.end() && envelope.occurred_at < iterator_record->second.occurred_at) {
        logger_->debug("Ignoring stale event from {} (when={} stored={})",
                       envelope.device_id,
                       envelope.occurred_at,
                       iterator_record->second.occurred_at);
        return false;
    }

    map_records_[envelope.device_id] = make_device_record(envelope);
    persist_locked();
    return true;
}

DeviceRecordMap DeviceEventStore::snapshot() {
    std::scoped_lock lock(mutex_);
    load_locked();
    return map_records_;
}

void DeviceEventStore::scan(const RecordVisitor& visitor) {
    std::scoped_lock lock(mutex_);
    load_locked();
    for (const auto& [device_id, record] : map_records_) {
        if (!visitor(record)) {
            break;
        }
    }
}

std::size_t DeviceEventStore::size() {
    std::scoped_lock lock(mutex_);
    load_locked();
    return map_records_.size();
}

void DeviceEventStore::load_locked() {
    if (flag_loaded_.load(std::memory_order_relaxed)) {
        return;
    }
    map_records_ = read_snapshot_file();
    flag_loaded_.store(true, std::memory_order_release);
}

DeviceRecordMap DeviceEventStore::read_snapshot_file() const {
    std::ifstream stream_snapshot(path_snapshot_, std::ios::binary);
    if (!stream_snapshot.is_open()) {
        std::error_code error_exists;
        if (std::filesystem::exists(path_snapshot_, error_exists)) {
            logger_->error("Can't open snapshot {}; starting empty", path_snapshot_.string());
        } else {
            logger_->info("No snapshot at {}; starting empty", path_snapshot_.string());
        }
        return {};
    }

    const std::string contents{std::istreambuf_iterator<char>(stream_snapshot), std::istreambuf_iterator<char>()};
    try {
        DeviceRecordMap records = records_from_json(nlohmann::json::parse(contents));
        logger_->info("Loaded {} device records from {}", records.size(), path_snapshot_.string());
        return records;
    } catch (const std::exception& exc) {
        logger_->error("Can't load snapshot {}: {}; starting empty", path_snapshot_.string(), exc.what());
        return {};
    }
}

void DeviceEventStore::persist_locked() const {
    std::string serialized;
    try {
        serialized = records_to_json(map_records_).dump();
    } catch (const nlohmann::json::exception& exc) {
        logger_->error("Can't serialize snapshot: {}", exc.what());
        return;
    }

    std::filesystem::path path_temporary = path_snapshot_;
    path_temporary += ".tmp";
    {
        std::ofstream stream_out(path_temporary, std::ios::binary | std::ios::trunc);
        if (!stream_out.is_open()) {
            logger_->error("Can't store {}: unable to open {}", path_snapshot_.string(), path_temporary.string());
            return;
        }
        stream_out.write(serialized.data(), static_cast<std::streamsize>(serialized.size()));
        stream_out.flush();
        if (!stream_out) {
            logger_->error("Can't store {}: write to {} failed", path_snapshot_.string(), path_temporary.string());
            std::error_code error_remove;
            std::filesystem::remove(path_temporary, error_remove);
            return;
        }
    }

    std::error_code error_rename;
    std::filesystem::rename(path_temporary, path_snapshot_, error_rename);
    if (error_rename) {
        logger_->error("Can't store {}: {}", path_snapshot_.string(), error_rename.message());
        std::error_code error_remove;
        std::filesystem::remove(path_temporary, error_remove);
    }
}

}  // namespace radnote
