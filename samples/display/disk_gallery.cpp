/**
 * @file disk_gallery.cpp
 * @brief Example: render every figure family of the Poincare disk to PNG
 *
 * Usage: disk_gallery [output_dir] [size]
 */

#include <HypDisk/HypDisk.h>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>

using namespace Hyp::Disk;
using namespace Hyp::Disk::Display;

namespace {

bool Render(const std::string& path, int32_t size,
            const std::function<void(DiskDrawer&)>& draw) {
    RasterSurface surface(size, size);
    DiskDrawer drawer(&surface);
    drawer.SetEmptyPoincareDisk();
    draw(drawer);

    bool ok = surface.SaveToFile(path);
    printf("   %-32s %s\n", path.c_str(), ok ? "saved" : "FAILED");
    return ok;
}

} // namespace

int main(int argc, char** argv) {
    Log::LoadEnvLevels();

    const std::string dir = argc > 1 ? argv[1] : ".";
    const int32_t size = argc > 2 ? std::atoi(argv[2]) : 600;
    if (size <= 0) {
        printf("Invalid size '%s'\n", argv[2]);
        return 1;
    }

    printf("=== HypDisk Sample: Disk Gallery (%dx%d) ===\n\n", size, size);

    int failed = 0;
    try {
        // 1. Triangle from three angles
        printf("1. Triangle 30/10/120 degrees\n");
        failed += !Render(dir + "/triangle.png", size, [](DiskDrawer& d) {
            Triangle t = d.HandleTriangleDrawing(30.0, 0.0, 10.0, 0.0, 120.0, 0.0, 0.0);
            printf("   %s\n", t.ToString().c_str());
        });

        // 2. Regular polygons
        printf("\n2. Regular pentagon and heptagon\n");
        failed += !Render(dir + "/polygons.png", size, [](DiskDrawer& d) {
            d.CreatePolygon(5, 50.0, 20.0);
            d.CreatePolygon(7, 60.0, 0.0);
        });

        // 3. Rectangle (Lambert quadrilateral)
        printf("\n3. Rectangle\n");
        failed += !Render(dir + "/rectangle.png", size, [](DiskDrawer& d) {
            d.CreateRectangle(30.0, 0.0, 5.0, 2.0, 10.0);
        });

        // 4. Geodesic lines
        printf("\n4. Geodesics, perpendiculars and parallels\n");
        failed += !Render(dir + "/lines.png", size, [](DiskDrawer& d) {
            d.CreateHyperbolicLine(350.0, 10.0);
            d.CreatePerpendiculars(5, 90.0);
            d.CreateParallels(6, 200.0);
        });

        // 5. Fixed patterns
        printf("\n5. Complex pattern and perpendicular rosette\n");
        failed += !Render(dir + "/pattern.png", size, [](DiskDrawer& d) { d.DrawComplexPattern(); });
        failed += !Render(dir + "/rosette.png", size, [](DiskDrawer& d) { d.DrawPerpendicularRosette(); });

        // 6. Circles
        printf("\n6. Oricycles and circle series\n");
        failed += !Render(dir + "/circles.png", size, [](DiskDrawer& d) {
            d.CreateOricycle(4, 45.0);
            d.HandleCircleSeriesDrawing(6, 0.5, 3.0);
            d.HandleCircleDrawing(0.9, 0.0);
        });
    } catch (const Exception& e) {
        printf("\nDrawing failed: %s\n", e.what());
        return 2;
    }

    printf("\n=== Done (%d failed) ===\n", failed);
    return failed == 0 ? 0 : 1;
}
