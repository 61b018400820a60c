/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_CHUNK_BUFFER_H
#define GRIDLINK_CHUNK_BUFFER_H

#include <stddef.h>
#include <stdint.h>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <etl/optional.h>

#include "gridlink_error.h"

namespace gridlink {
namespace transfer {

// Inclusive stretch of missing chunk indices, for reporting.
struct IndexRange {
  uint32_t first;
  uint32_t last;
};

std::string formatRanges(const std::vector<IndexRange>& ranges);

/**
 * Reassembly buffer for one chunked transfer.
 *
 * Chunk indices are the only ordering guarantee the transport gives, so
 * arrival order is never assumed: chunks are stored per index and only
 * materialize() concatenates them. Re-delivery of an index overwrites the
 * stored bytes (at-least-once delivery repeats identical payloads).
 *
 * The declared total is the running maximum over every chunk seen; it
 * never shrinks.
 */
class ChunkBuffer {
 public:
  ChunkBuffer();

  // Stores header metadata. Last value wins.
  bool acceptHeader(const nlohmann::json& meta);

  /**
   * @brief Store one chunk.
   *
   * @param index          Chunk index as sent by the device.
   * @param declared_total Total chunk count the device declares.
   * @param payload        Decoded chunk bytes.
   * @return false with INVALID_CHUNK for a negative index; the buffer is
   *         left unchanged.
   */
  bool acceptChunk(int64_t index, uint32_t declared_total, const std::vector<uint8_t>& payload);

  // Records the device-asserted final size; does not gate completeness.
  bool acceptComplete(uint64_t total_size);

  bool isComplete() const;

  // Indices in [0, total_declared) with no stored chunk, ascending.
  std::vector<uint32_t> missing() const;
  std::vector<IndexRange> missingRanges() const;

  /**
   * @brief Concatenate chunks 0..total_declared-1 in index order.
   *
   * @return false with INCOMPLETE_TRANSFER (naming the missing stretches)
   *         when any index is absent; out is left empty.
   */
  bool materialize(std::vector<uint8_t>& out) const;

  // Freezes the transfer. Later accept* calls are rejected.
  void finalize() { _finalized = true; }
  bool isFinalized() const { return _finalized; }

  bool hasStarted() const { return _header.has_value() || !_chunks.empty(); }

  uint32_t totalDeclared() const { return _total_declared; }
  size_t receivedCount() const { return _chunks.size(); }
  uint64_t receivedBytes() const { return _received_bytes; }
  uint32_t duplicateCount() const { return _duplicates; }

  const etl::optional<nlohmann::json>& header() const { return _header; }
  const etl::optional<uint64_t>& completionTotalSize() const { return _completion_total_size; }

  const Error& lastError() const { return _last_error; }
  void clearError() { _last_error = Error(); }

 private:
  bool rejectIfFinalized(const char* what);

  std::map<uint32_t, std::vector<uint8_t> > _chunks;
  uint32_t _total_declared;
  uint64_t _received_bytes;
  uint32_t _duplicates;
  etl::optional<nlohmann::json> _header;
  etl::optional<uint64_t> _completion_total_size;
  bool _finalized;
  mutable Error _last_error;
};

}  // namespace transfer
}  // namespace gridlink

#endif  // GRIDLINK_CHUNK_BUFFER_H
