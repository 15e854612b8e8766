/**
 * @file test_main.cpp
 * @brief Google Test 主入口文件
 *
 * picmod 命令行工具单元测试入口
 */

#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char** argv) {
    std::cout << "========================================" << std::endl;
    std::cout << "PictureModify CLI - Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
