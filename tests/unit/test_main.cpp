#include <gtest/gtest.h>
#include <QiLandscape/QiLandscape.h>

#include <iostream>

int main(int argc, char** argv) {
    // Print library info
    std::cout << "========================================\n";
    std::cout << "QiLandscape Unit Tests\n";
    std::cout << "Version: " << Qi::Landscape::GetVersion() << "\n";
    std::cout << "========================================\n\n";

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
