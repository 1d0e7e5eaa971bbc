#include <gtest/gtest.h>
#include <HypDisk/HypDisk.h>

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    // Rejected-input warnings are expected here; SPDLOG_LEVEL re-enables them
    Hyp::Disk::Log::SetLevel(spdlog::level::off);
    Hyp::Disk::Log::LoadEnvLevels();

    // Print library info
    std::cout << "========================================\n";
    std::cout << "HypDisk Unit Tests\n";
    std::cout << "Version: " << Hyp::Disk::GetVersion() << "\n";
    auto level = spdlog::level::to_string_view(Hyp::Disk::Log::Get()->level());
    std::cout << "Log level: " << std::string(level.data(), level.size()) << "\n";
    std::cout << "========================================\n\n";

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
