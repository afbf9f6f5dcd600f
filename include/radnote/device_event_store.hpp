// === Device Event Store ======================================================
//
// Owns the last-known radiation record for every reporting device and the
// on-disk snapshot of that mapping. A single mutex serializes the lazy load,
// every read-modify-write together with its snapshot write, and every scan
// taken by the query components.

#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>

#include "radnote/device_record.hpp"
#include "radnote/logging.hpp"
#include "radnote/telemetry_envelope.hpp"

namespace radnote {

/** @brief Concurrency-safe keyed store of the latest reading per device. */
class DeviceEventStore final {
  public:
    /**
     * @brief Visitor invoked per record during a scan.
     *
     * Return false to stop the scan early.
     */
    using RecordVisitor = std::function<bool(const DeviceRecord&)>;

    /**
     * @brief Construct a store persisting to @p snapshot_path.
     *
     * Nothing is read from disk until the first operation.
     */
    explicit DeviceEventStore(std::filesystem::path snapshot_path);

    DeviceEventStore(const DeviceEventStore&) = delete;
    DeviceEventStore& operator=(const DeviceEventStore&) = delete;

    /** @brief Location of the persisted snapshot. */
    [[nodiscard]] const std::filesystem::path& snapshot_path() const noexcept;

    /**
     * @brief Load the persisted snapshot once per store lifetime.
     *
     * A missing file leaves the store empty. A malformed file is logged and
     * the store starts empty. Later calls are no-ops.
     */
    void ensure_loaded();

    /**
     * @brief Retain @p envelope if it is a radiation reading no older than the stored one.
     *
     * An accepted update rewrites the whole snapshot file before the lock is
     * released. A failed write is logged; the in-memory record is kept.
     *
     * @return true when the record was replaced; false for other notefile
     *         kinds and for envelopes older than the stored record.
     */
    [[nodiscard]] bool record_event(const TelemetryEnvelope& envelope);

    /** @brief Copy of every record as of a single instant. */
    [[nodiscard]] DeviceRecordMap snapshot();

    /** @brief Visit records under the store lock until @p visitor returns false. */
    void scan(const RecordVisitor& visitor);

    /** @brief Number of devices with a retained record. */
    [[nodiscard]] std::size_t size();

  private:
    void load_locked();
    [[nodiscard]] DeviceRecordMap read_snapshot_file() const;
    void persist_locked() const;

    std::filesystem::path path_snapshot_;
    std::mutex mutex_;
    std::atomic<bool> flag_loaded_{false};
    DeviceRecordMap map_records_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace radnote
