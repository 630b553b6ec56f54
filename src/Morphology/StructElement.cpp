/**
 * @file StructElement.cpp
 * @brief Structuring element construction and parsing
 */

#include <CellDeclump/Morphology/StructElement.h>
#include <CellDeclump/Core/Exception.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace Cell::Declump {

namespace {

void RequireRadius(int32_t radius, const char* funcName) {
    if (radius < 0) {
        throw InvalidArgumentException(std::string(funcName) +
                                       ": radius must be >= 0, got " + std::to_string(radius));
    }
}

void RequireOddExtent(int32_t extent, const char* funcName) {
    if (extent <= 0 || extent % 2 == 0) {
        throw InvalidArgumentException(std::string(funcName) +
                                       ": extent must be a positive odd number, got " +
                                       std::to_string(extent));
    }
}

// Fill every voxel whose offset from the centre satisfies pred(dz, dy, dx)
template<typename Pred>
QVolume<uint8_t> BuildMask(const Size3i& size, Pred pred) {
    QVolume<uint8_t> mask(size, 0);
    int32_t cz = size.depth / 2;
    int32_t cy = size.height / 2;
    int32_t cx = size.width / 2;
    for (int32_t z = 0; z < size.depth; ++z) {
        for (int32_t y = 0; y < size.height; ++y) {
            for (int32_t x = 0; x < size.width; ++x) {
                if (pred(z - cz, y - cy, x - cx)) {
                    mask.At(z, y, x) = 1;
                }
            }
        }
    }
    return mask;
}

std::string ShapeName(StructElementShape shape) {
    switch (shape) {
        case StructElementShape::Disk:       return "disk";
        case StructElementShape::Square:     return "square";
        case StructElementShape::Rectangle:  return "rectangle";
        case StructElementShape::Diamond:    return "diamond";
        case StructElementShape::Ball:       return "ball";
        case StructElementShape::Cube:       return "cube";
        case StructElementShape::Octahedron: return "octahedron";
        case StructElementShape::Custom:     return "custom";
    }
    return "custom";
}

std::string Trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

StructElement::StructElement(StructElementShape shape, int32_t parameter,
                             QVolume<uint8_t> mask)
    : shape_(shape), parameter_(parameter), mask_(std::move(mask)) {
    Point3i anchor = Anchor();
    for (size_t i = 0; i < mask_.NumVoxels(); ++i) {
        if (mask_[i] != 0) {
            offsets_.push_back(mask_.Coord(i) - anchor);
        }
    }
}

StructElement StructElement::Disk(int32_t radius) {
    RequireRadius(radius, "StructElement::Disk");
    int32_t size = 2 * radius + 1;
    int64_t r2 = static_cast<int64_t>(radius) * radius;
    auto mask = BuildMask(Size3i::Plane(size, size), [r2](int32_t, int32_t dy, int32_t dx) {
        return static_cast<int64_t>(dy) * dy + static_cast<int64_t>(dx) * dx <= r2;
    });
    return StructElement(StructElementShape::Disk, radius, std::move(mask));
}

StructElement StructElement::Square(int32_t width) {
    RequireOddExtent(width, "StructElement::Square");
    QVolume<uint8_t> mask(Size3i::Plane(width, width), 1);
    return StructElement(StructElementShape::Square, width, std::move(mask));
}

StructElement StructElement::Rectangle(int32_t height, int32_t width) {
    RequireOddExtent(height, "StructElement::Rectangle");
    RequireOddExtent(width, "StructElement::Rectangle");
    QVolume<uint8_t> mask(Size3i::Plane(height, width), 1);
    return StructElement(StructElementShape::Rectangle, height, std::move(mask));
}

StructElement StructElement::Diamond(int32_t radius) {
    RequireRadius(radius, "StructElement::Diamond");
    int32_t size = 2 * radius + 1;
    auto mask = BuildMask(Size3i::Plane(size, size), [radius](int32_t, int32_t dy, int32_t dx) {
        return std::abs(dy) + std::abs(dx) <= radius;
    });
    return StructElement(StructElementShape::Diamond, radius, std::move(mask));
}

StructElement StructElement::Ball(int32_t radius) {
    RequireRadius(radius, "StructElement::Ball");
    int32_t size = 2 * radius + 1;
    int64_t r2 = static_cast<int64_t>(radius) * radius;
    auto mask = BuildMask(Size3i::Stack(size, size, size),
                          [r2](int32_t dz, int32_t dy, int32_t dx) {
        return static_cast<int64_t>(dz) * dz + static_cast<int64_t>(dy) * dy +
               static_cast<int64_t>(dx) * dx <= r2;
    });
    return StructElement(StructElementShape::Ball, radius, std::move(mask));
}

StructElement StructElement::Cube(int32_t width) {
    RequireOddExtent(width, "StructElement::Cube");
    QVolume<uint8_t> mask(Size3i::Stack(width, width, width), 1);
    return StructElement(StructElementShape::Cube, width, std::move(mask));
}

StructElement StructElement::Octahedron(int32_t radius) {
    RequireRadius(radius, "StructElement::Octahedron");
    int32_t size = 2 * radius + 1;
    auto mask = BuildMask(Size3i::Stack(size, size, size),
                          [radius](int32_t dz, int32_t dy, int32_t dx) {
        return std::abs(dz) + std::abs(dy) + std::abs(dx) <= radius;
    });
    return StructElement(StructElementShape::Octahedron, radius, std::move(mask));
}

StructElement StructElement::FromMask(const QVolume<uint8_t>& mask) {
    if (mask.Empty()) {
        throw InvalidArgumentException("StructElement::FromMask: mask is empty");
    }
    if (mask.NDim() == 3) {
        RequireOddExtent(mask.Depth(), "StructElement::FromMask");
    }
    RequireOddExtent(mask.Height(), "StructElement::FromMask");
    RequireOddExtent(mask.Width(), "StructElement::FromMask");

    QVolume<uint8_t> normalized = QVolume<uint8_t>::Like(mask);
    for (size_t i = 0; i < mask.NumVoxels(); ++i) {
        normalized[i] = mask[i] != 0 ? 1 : 0;
    }
    return StructElement(StructElementShape::Custom, 0, std::move(normalized));
}

StructElement StructElement::Parse(const std::string& text) {
    size_t comma = text.find(',');
    if (comma == std::string::npos) {
        throw InvalidArgumentException("StructElement::Parse: expected \"shape,size\", got \"" +
                                       text + "\"");
    }

    std::string name = Trim(text.substr(0, comma));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string sizeText = Trim(text.substr(comma + 1));

    char* end = nullptr;
    long size = std::strtol(sizeText.c_str(), &end, 10);
    if (sizeText.empty() || end == nullptr || *end != '\0') {
        throw InvalidArgumentException("StructElement::Parse: invalid size \"" + sizeText + "\"");
    }
    int32_t value = static_cast<int32_t>(size);

    if (name == "disk") return Disk(value);
    if (name == "square") return Square(value);
    if (name == "diamond") return Diamond(value);
    if (name == "ball") return Ball(value);
    if (name == "cube") return Cube(value);
    if (name == "octahedron") return Octahedron(value);

    throw InvalidArgumentException("StructElement::Parse: unknown shape \"" + name + "\"");
}

// =============================================================================
// Properties
// =============================================================================

Point3i StructElement::Anchor() const {
    if (mask_.Empty()) return {};
    return {mask_.Depth() / 2, mask_.Height() / 2, mask_.Width() / 2};
}

bool StructElement::Contains(int32_t dz, int32_t dy, int32_t dx) const {
    if (mask_.Empty()) return false;
    Point3i p = Anchor() + Point3i(dz, dy, dx);
    return mask_.Contains(p) && mask_.At(p) != 0;
}

std::string StructElement::ToString() const {
    if (shape_ == StructElementShape::Custom) return ShapeName(shape_);
    if (shape_ == StructElementShape::Rectangle) {
        return ShapeName(shape_) + "," + std::to_string(mask_.Height()) + "," +
               std::to_string(mask_.Width());
    }
    return ShapeName(shape_) + "," + std::to_string(parameter_);
}

} // namespace Cell::Declump
