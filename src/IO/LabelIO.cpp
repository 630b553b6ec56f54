/**
 * @file LabelIO.cpp
 * @brief Label image file I/O implementation
 *
 * Decoding through stb_image, PNG output through stb_image_write, 16-bit
 * output as binary PGM.
 */

#include <CellDeclump/IO/LabelIO.h>
#include <CellDeclump/Core/Exception.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>

// stb_image for file I/O
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <stb/stb_image_write.h>

namespace Cell::Declump::IO {

namespace {

std::string LowerExtension(const std::string& path) {
    size_t dotPos = path.rfind('.');
    size_t slashPos = path.find_last_of("/\\");
    if (dotPos == std::string::npos ||
        (slashPos != std::string::npos && dotPos < slashPos)) {
        return "";
    }
    std::string ext = path.substr(dotPos);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// Decoded single-channel raster, 8 or 16 bit
struct Raster {
    int32_t width = 0;
    int32_t height = 0;
    bool is16 = false;
    std::vector<uint16_t> values;
};

Raster Decode(const std::string& path, int desiredChannels) {
    Raster raster;
    int w = 0, h = 0, channels = 0;
    raster.is16 = stbi_is_16_bit(path.c_str()) != 0;

    if (raster.is16) {
        stbi_us* data = stbi_load_16(path.c_str(), &w, &h, &channels, desiredChannels);
        if (!data) {
            throw IOException("Failed to load image: " + path + " (" + stbi_failure_reason() + ")");
        }
        if (desiredChannels == 0 && channels != 1) {
            stbi_image_free(data);
            throw UnsupportedException("Unsupported channel count: " + std::to_string(channels));
        }
        raster.values.assign(data, data + static_cast<size_t>(w) * h);
        stbi_image_free(data);
    } else {
        stbi_uc* data = stbi_load(path.c_str(), &w, &h, &channels, desiredChannels);
        if (!data) {
            throw IOException("Failed to load image: " + path + " (" + stbi_failure_reason() + ")");
        }
        if (desiredChannels == 0 && channels != 1) {
            stbi_image_free(data);
            throw UnsupportedException("Unsupported channel count: " + std::to_string(channels));
        }
        raster.values.assign(data, data + static_cast<size_t>(w) * h);
        stbi_image_free(data);
    }

    raster.width = w;
    raster.height = h;
    return raster;
}

void WriteFile(const std::string& path, const std::string& header,
               const std::vector<uint8_t>& payload) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOException("Cannot open for writing: " + path);
    }
    file.write(header.data(), static_cast<std::streamsize>(header.size()));
    file.write(reinterpret_cast<const char*>(payload.data()),
               static_cast<std::streamsize>(payload.size()));
    if (!file.good()) {
        throw IOException("Failed to write: " + path);
    }
}

void WritePGM(const std::string& path, int32_t width, int32_t height,
              const std::vector<int32_t>& values, int32_t maxValue) {
    bool wide = maxValue > 255;
    std::string header = "P5\n" + std::to_string(width) + " " + std::to_string(height) + "\n" +
                         std::to_string(wide ? 65535 : 255) + "\n";

    std::vector<uint8_t> payload;
    payload.reserve(values.size() * (wide ? 2 : 1));
    for (int32_t v : values) {
        if (wide) {
            // Big endian, as required by the format
            payload.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        }
        payload.push_back(static_cast<uint8_t>(v & 0xFF));
    }
    WriteFile(path, header, payload);
}

} // anonymous namespace

// =============================================================================
// Reading
// =============================================================================

LabelImage ReadLabelImage(const std::string& path) {
    Raster raster = Decode(path, 0);

    LabelImage labels = LabelImage::Create2D(raster.height, raster.width);
    for (size_t i = 0; i < raster.values.size(); ++i) {
        labels[i] = raster.values[i];
    }

    spdlog::debug("ReadLabelImage: {} ({}x{}, {}-bit, max label {})", path, raster.width,
                  raster.height, raster.is16 ? 16 : 8, labels.Max());
    return labels;
}

LabelImage ReadLabelStack(const std::vector<std::string>& paths) {
    if (paths.empty()) return LabelImage();

    LabelImage first = ReadLabelImage(paths.front());
    LabelImage stack = LabelImage::Create3D(static_cast<int32_t>(paths.size()), first.Height(),
                                            first.Width());
    stack.SetSlice(0, first);
    for (size_t z = 1; z < paths.size(); ++z) {
        LabelImage slice = ReadLabelImage(paths[z]);
        if (slice.Height() != first.Height() || slice.Width() != first.Width()) {
            throw DimensionMismatchException("ReadLabelStack: slice " + paths[z] +
                                             " differs in size from " + paths.front());
        }
        stack.SetSlice(static_cast<int32_t>(z), slice);
    }
    return stack;
}

ScalarField ReadIntensityImage(const std::string& path) {
    Raster raster = Decode(path, 1);
    float scale = raster.is16 ? 1.0f / 65535.0f : 1.0f / 255.0f;

    ScalarField field = ScalarField::Create2D(raster.height, raster.width);
    for (size_t i = 0; i < raster.values.size(); ++i) {
        field[i] = raster.values[i] * scale;
    }
    return field;
}

// =============================================================================
// Writing
// =============================================================================

void WriteLabelImage(const std::string& path, const LabelImage& labels) {
    if (labels.Empty()) {
        throw InvalidArgumentException("WriteLabelImage: label image is empty");
    }
    if (labels.NDim() != 2) {
        throw UnsupportedException("WriteLabelImage: only 2D label images can be written");
    }
    if (labels.Min() < 0) {
        throw InvalidArgumentException("WriteLabelImage: labels must be non-negative");
    }

    int32_t maxLabel = labels.Max();
    if (maxLabel > 65535) {
        throw UnsupportedException("WriteLabelImage: label " + std::to_string(maxLabel) +
                                   " does not fit 16 bits");
    }

    std::string ext = LowerExtension(path);
    if (ext == ".png") {
        if (maxLabel > 255) {
            throw UnsupportedException("WriteLabelImage: " + std::to_string(maxLabel) +
                                       " labels need 16 bits, use .pgm");
        }
        std::vector<uint8_t> buffer(labels.Values().begin(), labels.Values().end());
        if (stbi_write_png(path.c_str(), labels.Width(), labels.Height(), 1, buffer.data(),
                           labels.Width()) == 0) {
            throw IOException("Failed to write: " + path);
        }
    } else if (ext == ".pgm") {
        WritePGM(path, labels.Width(), labels.Height(), labels.Values(), maxLabel);
    } else {
        throw UnsupportedException("WriteLabelImage: unknown extension '" + ext + "'");
    }

    spdlog::debug("WriteLabelImage: {} ({} labels)", path, maxLabel);
}

void WriteSeedMask(const std::string& path, const SeedMask& seeds) {
    LabelImage image = LabelImage::Like(seeds);
    for (size_t i = 0; i < seeds.NumVoxels(); ++i) {
        image[i] = seeds[i] != 0 ? 255 : 0;
    }
    WriteLabelImage(path, image);
}

} // namespace Cell::Declump::IO
