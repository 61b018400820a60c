/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_ARTIFACT_WRITER_H
#define GRIDLINK_ARTIFACT_WRITER_H

#include <stdint.h>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <etl/optional.h>

#include "gridlink_error.h"

namespace gridlink {
namespace storage {

constexpr const char ARTIFACT_PREFIX[] = "coredump_";
constexpr const char ARTIFACT_EXTENSION[] = ".bin";
constexpr const char HEADER_SUFFIX[] = "_header.json";

// coredump_<device>.bin, or coredump_<unix_seconds>.bin without a device.
std::string defaultArtifactName(const std::string& device, uint64_t unix_seconds);

// dump.bin -> dump_header.json; any other name gets the suffix appended.
std::string headerPathFor(const std::string& artifact_path);

bool writeBytes(const std::string& path, const std::vector<uint8_t>& bytes, Error& error);

// Pretty printed with a 2-space indent.
bool writeJson(const std::string& path, const nlohmann::json& document, Error& error);

/**
 * @brief Save a reconstructed dump and, when present, its header metadata.
 *
 * @return false with IO on the first failing write. A failed header write
 *         leaves the dump on disk.
 */
bool saveArtifact(const std::string& path, const std::vector<uint8_t>& bytes,
                  const etl::optional<nlohmann::json>& header, Error& error);

bool readFile(const std::string& path, std::vector<uint8_t>& out, Error& error);

}  // namespace storage
}  // namespace gridlink

#endif  // GRIDLINK_ARTIFACT_WRITER_H
