#include <gtest/gtest.h>
#include <BezClip/BezClip.h>

#include <cstring>
#include <iostream>

int main(int argc, char** argv) {
    using namespace Bez::Clip;

    ::testing::InitGoogleTest(&argc, argv);

    // Solver warnings for deliberately inconclusive cases are noise here
    Platform::SetLogLevel(Platform::LogLevel::Error);
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--debug-log") == 0) {
            Platform::SetLogLevel(Platform::LogLevel::Debug);
        }
    }

    std::cout << "========================================\n";
    std::cout << "BezClip Unit Tests\n";
    std::cout << "Version: " << GetVersion() << "\n";
    std::cout << "Threads: " << Platform::ThreadPool::Instance().Size()
              << " workers on " << Platform::GetNumCores() << " cores\n";
    std::cout << "========================================\n\n";

    return RUN_ALL_TESTS();
}
