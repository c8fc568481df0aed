#include <ppuview/file-io.h>
#include <ytrace/ytrace.hpp>
#include <fstream>
#include <iterator>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace ppuview {

Result<std::vector<uint8_t>> readBinaryFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Err<std::vector<uint8_t>>("Cannot open file: " + path);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Err<std::vector<uint8_t>>("Failed to read file: " + path);
    }
    ydebug("Read {} bytes from {}", data.size(), path);
    return Ok(std::move(data));
}

Result<void> writePng(const std::string& path, uint32_t width, uint32_t height,
                      const std::vector<uint8_t>& rgba) {
    if (rgba.size() != static_cast<size_t>(width) * height * 4) {
        return Err<void>("writePng: pixel buffer does not match " + std::to_string(width) +
                         "x" + std::to_string(height));
    }
    if (!stbi_write_png(path.c_str(), static_cast<int>(width), static_cast<int>(height), 4,
                        rgba.data(), static_cast<int>(width * 4))) {
        return Err<void>("Failed to write PNG: " + path);
    }
    yinfo("Wrote {}x{} PNG to {}", width, height, path);
    return Ok();
}

} // namespace ppuview
