#include "chunk_buffer.h"

#include <stdio.h>
#include <iterator>

#include <spdlog/spdlog.h>

namespace gridlink {
namespace transfer {

std::string formatRanges(const std::vector<IndexRange>& ranges) {
  std::string out;
  char buf[32];
  for (size_t i = 0; i < ranges.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    if (ranges[i].first == ranges[i].last) {
      snprintf(buf, sizeof(buf), "%u", ranges[i].first);
    } else {
      snprintf(buf, sizeof(buf), "%u-%u", ranges[i].first, ranges[i].last);
    }
    out += buf;
  }
  return out;
}

ChunkBuffer::ChunkBuffer()
    : _chunks(),
      _total_declared(0),
      _received_bytes(0),
      _duplicates(0),
      _header(),
      _completion_total_size(),
      _finalized(false),
      _last_error() {}

bool ChunkBuffer::rejectIfFinalized(const char* what) {
  if (!_finalized) {
    return false;
  }
  spdlog::debug("Transfer finalized, ignoring {}", what);
  return true;
}

bool ChunkBuffer::acceptHeader(const nlohmann::json& meta) {
  if (rejectIfFinalized("header")) {
    return false;
  }
  _header = meta;
  return true;
}

bool ChunkBuffer::acceptChunk(int64_t index, uint32_t declared_total,
                              const std::vector<uint8_t>& payload) {
  if (rejectIfFinalized("chunk")) {
    return false;
  }
  if (index < 0 || index > static_cast<int64_t>(UINT32_MAX)) {
    _last_error = Error(ErrorCode::INVALID_CHUNK,
                        "chunk index " + std::to_string(index) + " out of range");
    spdlog::warn("Dropping chunk: {}", _last_error.detail);
    return false;
  }

  const uint32_t slot = static_cast<uint32_t>(index);
  if (declared_total > 0 && slot >= declared_total) {
    // Kept: a later chunk may raise the declared total past this index.
    spdlog::warn("Chunk {} is beyond its declared total {}", slot, declared_total);
  }

  std::map<uint32_t, std::vector<uint8_t> >::iterator it = _chunks.find(slot);
  if (it != _chunks.end()) {
    _duplicates++;
    if (it->second != payload) {
      spdlog::warn("Chunk {} re-delivered with different content, keeping the latest", slot);
    }
    _received_bytes -= it->second.size();
    it->second = payload;
  } else {
    _chunks.insert(std::make_pair(slot, payload));
  }
  _received_bytes += payload.size();

  if (declared_total > _total_declared) {
    _total_declared = declared_total;
  }
  return true;
}

bool ChunkBuffer::acceptComplete(uint64_t total_size) {
  if (rejectIfFinalized("completion")) {
    return false;
  }
  _completion_total_size = total_size;
  return true;
}

bool ChunkBuffer::isComplete() const {
  if (_total_declared == 0) {
    return false;
  }
  // Keys are unique and ordered, so presence of every index in
  // [0, total) is equivalent to the count of keys below total.
  const size_t present = static_cast<size_t>(
      std::distance(_chunks.begin(), _chunks.lower_bound(_total_declared)));
  return present == _total_declared;
}

std::vector<uint32_t> ChunkBuffer::missing() const {
  std::vector<uint32_t> out;
  const std::vector<IndexRange> ranges = missingRanges();
  for (size_t i = 0; i < ranges.size(); ++i) {
    for (uint32_t index = ranges[i].first;; ++index) {
      out.push_back(index);
      if (index == ranges[i].last) {
        break;
      }
    }
  }
  return out;
}

std::vector<IndexRange> ChunkBuffer::missingRanges() const {
  // Walks the gaps between stored keys, so the cost follows the received
  // count rather than the declared total.
  std::vector<IndexRange> ranges;
  uint32_t next = 0;
  std::map<uint32_t, std::vector<uint8_t> >::const_iterator it = _chunks.begin();
  for (; it != _chunks.end() && it->first < _total_declared; ++it) {
    if (it->first > next) {
      IndexRange r;
      r.first = next;
      r.last = it->first - 1;
      ranges.push_back(r);
    }
    next = it->first + 1;
  }
  if (next < _total_declared) {
    IndexRange r;
    r.first = next;
    r.last = _total_declared - 1;
    ranges.push_back(r);
  }
  return ranges;
}

bool ChunkBuffer::materialize(std::vector<uint8_t>& out) const {
  out.clear();
  if (!isComplete()) {
    std::string detail;
    if (_total_declared == 0) {
      detail = "no chunks declared";
    } else {
      detail = "missing chunks: " + formatRanges(missingRanges());
    }
    _last_error = Error(ErrorCode::INCOMPLETE_TRANSFER, detail);
    return false;
  }

  size_t size = 0;
  for (uint32_t i = 0; i < _total_declared; ++i) {
    size += _chunks.find(i)->second.size();
  }
  out.reserve(size);
  for (uint32_t i = 0; i < _total_declared; ++i) {
    const std::vector<uint8_t>& chunk = _chunks.find(i)->second;
    out.insert(out.end(), chunk.begin(), chunk.end());
  }

  if (_completion_total_size.has_value() && _completion_total_size.value() != out.size()) {
    spdlog::warn("Device reported total size {} but reassembled {} bytes",
                 _completion_total_size.value(), out.size());
  }
  return true;
}

}  // namespace transfer
}  // namespace gridlink
