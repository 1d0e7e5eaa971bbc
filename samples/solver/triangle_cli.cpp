/**
 * @file triangle_cli.cpp
 * @brief Example: solve a hyperbolic triangle from the command line
 *
 * Usage: triangle_cli A a B b C c
 *   Angles in degrees, sides as hyperbolic lengths, 0 for unknown.
 *   Log level from SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=debug).
 */

#include <HypDisk/HypDisk.h>
#include <cstdio>
#include <cstdlib>

using namespace Hyp::Disk;

int main(int argc, char** argv) {
    Log::LoadEnvLevels();

    if (argc != 7) {
        printf("Usage: %s A a B b C c\n", argv[0]);
        printf("  angles in degrees, sides as hyperbolic lengths, 0 = unknown\n");
        printf("  e.g. %s 30 0 10 0 120 0\n", argv[0]);
        return 1;
    }

    double values[6];
    for (int i = 0; i < 6; ++i) {
        char* end = nullptr;
        values[i] = std::strtod(argv[i + 1], &end);
        if (end == argv[i + 1] || *end != '\0') {
            printf("Not a number: '%s'\n", argv[i + 1]);
            return 1;
        }
    }

    Triangle input = Triangle::FromSentinel(values[0] * DEG_TO_RAD, values[1],
                                            values[2] * DEG_TO_RAD, values[3],
                                            values[4] * DEG_TO_RAD, values[5]);

    printf("=== HypDisk Sample: Triangle Solver ===\n\n");
    printf("Input:  %s\n", input.ToString().c_str());

    try {
        Triangle solved = Solver::SolveTriangle(input);

        printf("\nSolution:\n");
        const char* names[3] = {"A", "B", "C"};
        const Vertex vertices[3] = {Vertex::A, Vertex::B, Vertex::C};
        for (int i = 0; i < 3; ++i) {
            printf("  %s = %10.6f deg   side %c = %.9f\n", names[i],
                   *solved.Angle(vertices[i]) * RAD_TO_DEG, 'a' + i,
                   *solved.Side(vertices[i]));
        }
        printf("\n  Area (angular defect) = %.9f\n", solved.Area());
    } catch (const Exception& e) {
        printf("\nCannot solve: %s\n", e.what());
        return 2;
    }

    return 0;
}
