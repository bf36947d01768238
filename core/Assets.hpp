#pragma once

#include <string>

// Data file path helpers. Resolves "assets/<relative>" by searching the
// working directory and up to three parents, so tools and tests find the
// tuning files whether they run from the repo root or a build directory.
//
// Usage:
//   LoadTuningFromFile(tuning, assets::Path("config/powerups.json"));

namespace assets {

std::string Path(const char* relative);

bool Exists(const char* relative);

}  // namespace assets
