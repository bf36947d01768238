#include "core/Assets.hpp"

#include <filesystem>
#include <system_error>

namespace assets {

namespace fs = std::filesystem;

namespace {

fs::path FindAssetsRoot() {
  std::error_code ec;
  fs::path current = fs::current_path(ec);
  if (ec) {
    return fs::path("assets");
  }

  for (int i = 0; i < 4; ++i) {
    if (fs::exists(current / "assets", ec)) {
      return current / "assets";
    }
    if (!current.has_parent_path() || current.parent_path() == current) {
      break;
    }
    current = current.parent_path();
  }
  return fs::path("assets");
}

} // namespace

std::string Path(const char *relative) {
  return (FindAssetsRoot() / relative).string();
}

bool Exists(const char *relative) {
  std::error_code ec;
  return fs::exists(Path(relative), ec);
}

} // namespace assets
