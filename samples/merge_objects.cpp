/**
 * @file merge_objects.cpp
 * @brief Example: merge undersized objects into their neighbours
 *
 * Usage: merge_objects <output> <labels> [<labels> ...] [options]
 *   --diameter <value>    Minimum object diameter (default 64)
 *   --remove              Delete small objects without object neighbours
 *   --absolute <n>        Require more than n contact pixels
 *   --relative <value>    Require more than this fraction of the surface in contact
 *   --planewise           Merge each slice of a stack separately
 *   -v                    Debug logging
 *
 * Several label files are read as the z-slices of one volume.
 */

#include <CellDeclump/CellDeclump.h>
#include <CellDeclump/IO/LabelIO.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

using namespace Cell::Declump;
using namespace Cell::Declump::Segment;

static void PrintUsage(const char* program) {
    spdlog::error("Usage: {} <output> <labels> [<labels> ...] [--diameter <value>] [--remove] "
                  "[--absolute <n> | --relative <value>] [--planewise] [-v]", program);
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        PrintUsage(argv[0]);
        return 1;
    }

    std::string outputPath = argv[1];
    std::vector<std::string> inputPaths;
    MergeObjectsParams params = MergeObjectsParams::Default();

    for (int i = 2; i < argc; ++i) {
        bool hasValue = i + 1 < argc;
        if (std::strcmp(argv[i], "--diameter") == 0 && hasValue) {
            params.diameter = std::atof(argv[++i]);
        } else if (std::strcmp(argv[i], "--remove") == 0) {
            params.removeBelowThreshold = true;
        } else if (std::strcmp(argv[i], "--absolute") == 0 && hasValue) {
            params.useContactArea = true;
            params.contactAreaMethod = ContactAreaMethod::Absolute;
            params.absoluteNeighborSize = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--relative") == 0 && hasValue) {
            params.useContactArea = true;
            params.contactAreaMethod = ContactAreaMethod::Relative;
            params.relativeNeighborSize = std::atof(argv[++i]);
        } else if (std::strcmp(argv[i], "--planewise") == 0) {
            params.planewise = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            spdlog::set_level(spdlog::level::debug);
        } else if (argv[i][0] == '-') {
            PrintUsage(argv[0]);
            return 1;
        } else {
            inputPaths.push_back(argv[i]);
        }
    }

    if (inputPaths.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }

    try {
        LabelImage labels = inputPaths.size() == 1 ? IO::ReadLabelImage(inputPaths.front())
                                                   : IO::ReadLabelStack(inputPaths);
        spdlog::info("CellDeclump {}: {}D labels, {} objects", GetVersion(), labels.NDim(),
                     labels.Max());

        LabelImage result = MergeObjects(labels, params);

        if (result.NDim() == 2) {
            IO::WriteLabelImage(outputPath, result);
        } else {
            // One file per slice: <output stem>_z<k><extension>
            size_t dot = outputPath.rfind('.');
            std::string stem = dot == std::string::npos ? outputPath : outputPath.substr(0, dot);
            std::string ext = dot == std::string::npos ? ".pgm" : outputPath.substr(dot);
            for (int32_t z = 0; z < result.Depth(); ++z) {
                IO::WriteLabelImage(stem + "_z" + std::to_string(z) + ext, result.Slice(z));
            }
        }

        spdlog::info("{} objects remain", result.Max());
    } catch (const Exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
