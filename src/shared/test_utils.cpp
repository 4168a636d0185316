#include <iostream>
#include <chrono>
#include <atomic>

#include "test_utils.hpp"

namespace TestUtils
{
    namespace
    {
        std::atomic<int> numRun(0);
        std::atomic<int> numFailed(0);
    }

    void runTest(std::string &testName, std::function<void()> &testFunc)
    {
        numRun++;
        std::cerr << "[ RUN  ] " << testName << std::endl;

        auto start = std::chrono::high_resolution_clock::now();
        bool passed = true;
        std::string failure;

        try
        {
            testFunc();
        }
        catch (const std::exception &e)
        {
            passed = false;
            failure = e.what();
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        if (passed)
        {
            std::cerr << "[ PASS ] " << testName << " (" << duration.count() << " ms)" << std::endl;
            return;
        }

        numFailed++;
        std::cerr << "[ FAIL ] " << testName << " (" << duration.count() << " ms)" << std::endl;
        std::cerr << "         " << failure << std::endl;
    }

    void printSuiteHeader(const std::string &suiteName)
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << suiteName << std::endl;
        std::cerr << "###################################" << std::endl;
    }

    int testsRun()
    {
        return numRun;
    }

    int testsFailed()
    {
        return numFailed;
    }
};
