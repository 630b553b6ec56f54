#pragma once

#include <CellDeclump/Core/Export.h>

/**
 * @file LabelIO.h
 * @brief Reading and writing label images, intensity images and seed masks
 *
 * Supported formats:
 * - PNG (8 or 16 bit grayscale)
 * - PGM / binary P5 (8 or 16 bit)
 *
 * Decoding uses stb_image; 8-bit PNG output uses stb_image_write.
 * 16-bit output is written as binary PGM.
 */

#include <CellDeclump/Core/QVolume.h>

#include <string>
#include <vector>

namespace Cell::Declump::IO {

/**
 * @brief Read a single-channel label image
 *
 * Pixel values are taken as labels without scaling.
 *
 * @throws IOException if the file cannot be decoded
 * @throws UnsupportedException if the image has more than one channel
 */
CELLDECLUMP_API LabelImage ReadLabelImage(const std::string& path);

/**
 * @brief Read a z-stack of label slices into a 3D label image
 *
 * @param paths Slice files, in z order
 * @throws DimensionMismatchException if slices differ in size
 */
CELLDECLUMP_API LabelImage ReadLabelStack(const std::vector<std::string>& paths);

/**
 * @brief Read an image as intensities scaled to [0, 1]
 *
 * Colour images are converted to luminance.
 */
CELLDECLUMP_API ScalarField ReadIntensityImage(const std::string& path);

/**
 * @brief Write a 2D label image
 *
 * ".png" requires every label to fit 8 bits. ".pgm" is written as 8-bit
 * P5 when possible and 16-bit (big endian) otherwise.
 *
 * @throws InvalidArgumentException if a label is negative
 * @throws UnsupportedException for 3D input, labels above 65535, labels
 *         above 255 in a PNG, or an unknown extension
 * @throws IOException if the file cannot be written
 */
CELLDECLUMP_API void WriteLabelImage(const std::string& path, const LabelImage& labels);

/**
 * @brief Write a 2D seed mask as a black/white 8-bit image
 */
CELLDECLUMP_API void WriteSeedMask(const std::string& path, const SeedMask& seeds);

} // namespace Cell::Declump::IO
