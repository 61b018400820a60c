#include "artifact_writer.h"

#include <string.h>
#include <errno.h>
#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>

#include "util/string_utils.h"

namespace gridlink {
namespace storage {

namespace {

Error ioError(const std::string& what, const std::string& path) {
  return Error(ErrorCode::IO, what + " " + path + ": " + strerror(errno));
}

}  // namespace

std::string defaultArtifactName(const std::string& device, uint64_t unix_seconds) {
  const std::string id = device.empty() ? std::to_string(unix_seconds) : device;
  return std::string(ARTIFACT_PREFIX) + id + ARTIFACT_EXTENSION;
}

std::string headerPathFor(const std::string& artifact_path) {
  if (util::endsWith(util::view(artifact_path), ARTIFACT_EXTENSION)) {
    const size_t stem = artifact_path.size() - strlen(ARTIFACT_EXTENSION);
    return artifact_path.substr(0, stem) + HEADER_SUFFIX;
  }
  return artifact_path + HEADER_SUFFIX;
}

bool writeBytes(const std::string& path, const std::vector<uint8_t>& bytes, Error& error) {
  std::ofstream out(path.c_str(), std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    error = ioError("cannot open", path);
    return false;
  }
  if (!bytes.empty()) {
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
  }
  out.close();
  if (out.fail()) {
    error = ioError("write failed for", path);
    return false;
  }
  return true;
}

bool writeJson(const std::string& path, const nlohmann::json& document, Error& error) {
  std::ofstream out(path.c_str(), std::ios::trunc);
  if (!out.is_open()) {
    error = ioError("cannot open", path);
    return false;
  }
  out << document.dump(2) << '\n';
  out.close();
  if (out.fail()) {
    error = ioError("write failed for", path);
    return false;
  }
  return true;
}

bool saveArtifact(const std::string& path, const std::vector<uint8_t>& bytes,
                  const etl::optional<nlohmann::json>& header, Error& error) {
  if (!writeBytes(path, bytes, error)) {
    return false;
  }
  spdlog::info("Core dump saved to {} ({} bytes)", path, bytes.size());

  if (header.has_value()) {
    const std::string header_path = headerPathFor(path);
    if (!writeJson(header_path, header.value(), error)) {
      return false;
    }
    spdlog::info("Header info saved to {}", header_path);
  }
  return true;
}

bool readFile(const std::string& path, std::vector<uint8_t>& out, Error& error) {
  std::ifstream in(path.c_str(), std::ios::binary);
  if (!in.is_open()) {
    error = ioError("cannot open", path);
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    error = ioError("read failed for", path);
    out.clear();
    return false;
  }
  return true;
}

}  // namespace storage
}  // namespace gridlink
