#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "generator_profile.h"
#include "mesh_generator.h"
#include "obj_mesh_sink.h"
#include "shapes.h"

namespace
{

void printUsage(const char* program)
{
    std::cerr << "Usage: " << program << " <shape> <output.obj> [profile.toml]\n"
              << "Shapes:";
    for (int index = 0; index < kShapeCount; ++index)
    {
        std::cerr << ' ' << shapeName(chooseShape(index));
    }
    std::cerr << std::endl;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 3 || argc > 4)
    {
        printUsage(argc > 0 ? argv[0] : "export_shape_obj");
        return EXIT_FAILURE;
    }

    const std::optional<int> index = shapeIndexFromName(argv[1]);
    if (!index)
    {
        std::cerr << "Unknown shape '" << argv[1] << "'" << std::endl;
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    const std::filesystem::path outputPath = argv[2];
    const std::filesystem::path profilePath = argc == 4 ? std::filesystem::path(argv[3])
                                                        : std::filesystem::path("assets/shapemesher.toml");

    try
    {
        GeneratorProfile profile = GeneratorProfile::load(profilePath);
        profile.initialShapeIndex = *index;

        std::ofstream out(outputPath, std::ios::trunc);
        if (!out)
        {
            std::cerr << "Failed to open " << outputPath << " for writing" << std::endl;
            return EXIT_FAILURE;
        }

        out << "# " << shapeName(chooseShape(*index)) << '\n';

        ObjMeshSink sink(out);
        MeshGenerator generator(std::move(profile));
        const GenerationSummary summary = generator.regenerate(sink);

        out.flush();
        if (!out)
        {
            std::cerr << "Failed to write " << outputPath << std::endl;
            return EXIT_FAILURE;
        }

        std::cout << "Wrote " << summary.meshesEmitted << " chunk meshes (" << summary.vertexCount << " vertices, "
                  << summary.triangleCount << " triangles) to " << outputPath << std::endl;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Export failed: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
