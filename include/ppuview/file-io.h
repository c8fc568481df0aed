#pragma once

#include <ppuview/result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace ppuview {

// Whole file as bytes (VRAM / CGRAM dumps)
Result<std::vector<uint8_t>> readBinaryFile(const std::string& path);

// Tightly packed RGBA8 rows to PNG
Result<void> writePng(const std::string& path, uint32_t width, uint32_t height,
                      const std::vector<uint8_t>& rgba);

} // namespace ppuview
