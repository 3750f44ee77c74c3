#include "confq/platform.h"

#include <array>

#if !defined(_WIN32)
#include <sys/utsname.h>
#endif

#include "confq/errors.h"
#include "util/string_util.h"

namespace confq {

namespace {

constexpr const char* kReleaseBase = "https://github.com/mikefarah/yq/releases/download/{version}/";

struct PlatformRow {
  const char* os;
  const char* arch;
  const char* asset;
  const char* binary_name;
};

constexpr std::array<PlatformRow, 5> kPlatforms = {{
    {"linux", "amd64", "yq_linux_amd64", "yq"},
    {"linux", "arm64", "yq_linux_arm64", "yq"},
    {"darwin", "amd64", "yq_darwin_amd64", "yq"},
    {"darwin", "arm64", "yq_darwin_arm64", "yq"},
    {"windows", "amd64", "yq_windows_amd64.exe", "yq.exe"},
}};

std::string normalize_os(const std::string& raw) {
  std::string os = util::to_lower(util::trim_ws(raw));
  if (os == "macos" || os == "osx" || os == "mac") return "darwin";
  if (os == "win32" || os == "win64" || os == "win") return "windows";
  return os;
}

std::string normalize_arch(const std::string& raw) {
  std::string arch = util::to_lower(util::trim_ws(raw));
  if (arch == "x86_64" || arch == "x64" || arch == "amd64") return "amd64";
  if (arch == "aarch64" || arch == "arm64" || arch == "armv8") return "arm64";
  return arch;
}

}  // namespace

Version default_minimum_version() {
  return Version{4, 52, 2};
}

std::string host_os() {
#if defined(_WIN32)
  return "windows";
#elif defined(__APPLE__)
  return "darwin";
#elif defined(__linux__)
  return "linux";
#else
  return "unknown";
#endif
}

std::string host_machine() {
#if defined(_WIN32)
#if defined(_M_ARM64)
  return "arm64";
#else
  return "amd64";
#endif
#else
  struct utsname info {};
  if (uname(&info) != 0) {
    return "unknown";
  }
  return info.machine;
#endif
}

BinaryDescriptor resolve() {
  return resolve(host_os(), host_machine());
}

BinaryDescriptor resolve(const std::string& os, const std::string& arch) {
  const std::string norm_os = normalize_os(os);
  const std::string norm_arch = normalize_arch(arch);
  for (const auto& row : kPlatforms) {
    if (norm_os != row.os || norm_arch != row.arch) continue;
    BinaryDescriptor descriptor;
    descriptor.os = row.os;
    descriptor.arch = row.arch;
    descriptor.platform_key = std::string(row.os) + "-" + row.arch;
    descriptor.filename = row.asset;
    descriptor.binary_name = row.binary_name;
    descriptor.download_url_template = std::string(kReleaseBase) + row.asset;
    descriptor.minimum_version = default_minimum_version();
    return descriptor;
  }
  std::string supported;
  for (const auto& key : supported_platform_keys()) {
    if (!supported.empty()) supported += ", ";
    supported += key;
  }
  throw UnsupportedPlatformError("Unsupported platform: " + os + "/" + arch +
                                 " (supported: " + supported + ")");
}

std::vector<std::string> supported_platform_keys() {
  std::vector<std::string> keys;
  keys.reserve(kPlatforms.size());
  for (const auto& row : kPlatforms) {
    keys.push_back(std::string(row.os) + "-" + row.arch);
  }
  return keys;
}

std::string download_url(const BinaryDescriptor& descriptor, const Version& version) {
  std::string url = descriptor.download_url_template;
  const std::string placeholder = "{version}";
  size_t pos = url.find(placeholder);
  while (pos != std::string::npos) {
    url.replace(pos, placeholder.size(), to_string(version));
    pos = url.find(placeholder, pos);
  }
  return url;
}

}  // namespace confq
