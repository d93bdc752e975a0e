#include <gtest/gtest.h>
#include "excelpipe/ExcelPipe.hpp"

#include <iostream>

// 测试主函数
int main(int argc, char** argv) {
    std::cout << "ExcelPipe 单元测试开始..." << std::endl;

    // 日志只写文件，避免干扰测试输出
    excelpipe::initialize("logs/excelpipe_tests.log", excelpipe::utils::Logger::Level::DEBUG, false);

    ::testing::InitGoogleTest(&argc, argv);
    int result = RUN_ALL_TESTS();

    if (result == 0) {
        std::cout << "所有测试通过！" << std::endl;
    } else {
        std::cout << "有测试失败！" << std::endl;
    }

    excelpipe::cleanup();
    return result;
}
