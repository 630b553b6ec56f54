/**
 * @file seed_objects.cpp
 * @brief Example: write the seed mask of a label image
 *
 * Usage: seed_objects <labels> <output> [options]
 *   --sigma <value>       Distance field smoothing (default 1)
 *   --min-distance <n>    Minimum seed spacing (default 1)
 *   --threshold <value>   Relative seed threshold in [0, 1] (default 0)
 *   --element <shape,n>   Seed dilation element, e.g. "disk,1" (default)
 *   --per-object <n>      Keep at most n seeds per object (default unlimited)
 *   --seed <n>            Random seed for the per-object cap
 *   -v                    Debug logging
 */

#include <CellDeclump/CellDeclump.h>
#include <CellDeclump/IO/LabelIO.h>
#include <CellDeclump/Platform/Random.h>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace Cell::Declump;
using namespace Cell::Declump::Segment;

static void PrintUsage(const char* program) {
    spdlog::error("Usage: {} <labels> <output> [--sigma <value>] [--min-distance <n>] "
                  "[--threshold <value>] [--element <shape,n>] [--per-object <n>] [--seed <n>] [-v]",
                  program);
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        PrintUsage(argv[0]);
        return 1;
    }

    std::string inputPath = argv[1];
    std::string outputPath = argv[2];
    SeedObjectsParams params = SeedObjectsParams::Default();
    std::string elementText = "disk,1";
    bool seeded = false;
    uint64_t randomSeed = 0;

    for (int i = 3; i < argc; ++i) {
        bool hasValue = i + 1 < argc;
        if (std::strcmp(argv[i], "--sigma") == 0 && hasValue) {
            params.sigma = std::atof(argv[++i]);
        } else if (std::strcmp(argv[i], "--min-distance") == 0 && hasValue) {
            params.finder.minDistance = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--threshold") == 0 && hasValue) {
            params.finder.threshold = std::atof(argv[++i]);
        } else if (std::strcmp(argv[i], "--element") == 0 && hasValue) {
            elementText = argv[++i];
        } else if (std::strcmp(argv[i], "--per-object") == 0 && hasValue) {
            params.maxSeedsPerObject = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--seed") == 0 && hasValue) {
            randomSeed = std::strtoull(argv[++i], nullptr, 10);
            seeded = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            spdlog::set_level(spdlog::level::debug);
        } else {
            PrintUsage(argv[0]);
            return 1;
        }
    }

    try {
        params.structElement = StructElement::Parse(elementText);

        Platform::Random& rng = Platform::Random::Instance();
        if (seeded) rng.SetSeed(randomSeed);

        LabelImage labels = IO::ReadLabelImage(inputPath);
        spdlog::info("CellDeclump {}: {}x{} labels, {} objects", GetVersion(),
                     labels.Width(), labels.Height(), labels.Max());

        SeedMask seeds = GenerateSeeds(labels, params, rng);
        IO::WriteSeedMask(outputPath, seeds);

        spdlog::info("Wrote {} seed pixels to {}", seeds.CountNonZero(), outputPath);
    } catch (const Exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
