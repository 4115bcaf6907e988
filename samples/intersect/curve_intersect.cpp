/**
 * @file curve_intersect.cpp
 * @brief Curve intersection demo - Bézier clipping on a few curve pairs
 *
 * Demonstrates:
 * - IntersectCurves for a single crossing, a shared endpoint and a miss
 * - IntersectCurvesAll on curves crossing several times
 * - Debug logging of the clip steps
 */

#include <BezClip/BezClip.h>

#include <cstring>
#include <iomanip>
#include <iostream>

using namespace Bez::Clip;
using namespace Bez::Clip::Platform;

namespace {

void PrintCurve(const char* name, const CubicBezier& curve) {
    std::cout << name << ":";
    for (const Point2d& p : curve.Points()) {
        std::cout << " (" << p.x << ", " << p.y << ")";
    }
    std::cout << std::endl;
}

void RunSingle(const char* title, const CubicBezier& a, const CubicBezier& b) {
    std::cout << "\n--- " << title << " ---" << std::endl;
    PrintCurve("A", a);
    PrintCurve("B", b);

    CurveIntersectResult result = IntersectCurves(a, b);

    std::cout << "Status: " << ToString(result.status)
              << " after " << result.iterations << " steps" << std::endl;
    if (result.Found()) {
        std::cout << "  t1 = " << result.intersection.t1
                  << ", t2 = " << result.intersection.t2 << std::endl;
        std::cout << "  point = (" << result.intersection.point.x << ", "
                  << result.intersection.point.y << ")" << std::endl;
    } else {
        std::cout << "  t1 in [" << result.interval1.low << ", " << result.interval1.high
                  << "], t2 in [" << result.interval2.low << ", " << result.interval2.high
                  << "]" << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 1 && std::strcmp(argv[1], "--debug") == 0) {
        SetLogLevel(LogLevel::Debug);
    }

    std::cout << "=== Bezier Clipping Demo (BezClip " << GetVersion() << ") ===" << std::endl;
    std::cout << std::fixed << std::setprecision(6);

    CubicBezier a({18, 122}, {15, 178}, {247, 173}, {251, 242});
    CubicBezier b({24, 21}, {189, 40}, {159, 137}, {101, 261});
    CubicBezier c({251, 242}, {300, 200}, {320, 150}, {400, 100});
    CubicBezier d({524, 21}, {689, 40}, {659, 137}, {601, 261});

    RunSingle("Crossing curves", a, b);
    RunSingle("Shared endpoint", a, c);
    RunSingle("Disjoint curves", a, d);

    // Nine crossings: the single solver stalls, enumeration separates them
    CubicBezier wave1({108, 219}, {143, 16}, {121, 255}, {143, 136});
    CubicBezier wave2({62, 156}, {267, 192}, {14, 125}, {156, 153});

    std::cout << "\n--- All intersections ---" << std::endl;
    PrintCurve("A", wave1);
    PrintCurve("B", wave2);

    CurveIntersectResultN all = IntersectCurvesAll(wave1, wave2);

    std::cout << "Found " << all.Count() << " intersections in " << all.subproblems
              << " subproblems, " << all.iterations << " steps"
              << (all.inconclusive ? " (inconclusive)" : "") << std::endl;
    for (const CurveIntersection& hit : all.intersections) {
        std::cout << "  t1 = " << hit.t1 << ", t2 = " << hit.t2
                  << ", point = (" << hit.point.x << ", " << hit.point.y << ")" << std::endl;
    }

    return 0;
}
