#pragma once
#include <string>
#include <functional>
#include <stdexcept>

/**
 * For the given `testFunc`, builds a pair of form:
 *      {function_name, function_pointer}
 */
#define TEST(testFunc) {#testFunc, testFunc}

/**
 * For the given `condition`, throw a runtime error
 * if it doesn't evaluate to true.
 */
#define ASSERT_THAT(condition) \
    if (!(condition)) throw std::runtime_error(std::string(#condition) + " failed at line: " + std::to_string(__LINE__))

/**
 * Throws a runtime error unless evaluating `expression` throws
 * an exception of type `exceptionType`.
 */
#define ASSERT_THROWS(expression, exceptionType)                                        \
    {                                                                                   \
        bool caught = false;                                                            \
        try { expression; }                                                             \
        catch (const exceptionType &) { caught = true; }                                \
        if (!caught)                                                                    \
            throw std::runtime_error(std::string(#expression) + " did not throw "       \
                + #exceptionType + " at line: " + std::to_string(__LINE__));            \
    }

/**
 * Testing library
 */
namespace TestUtils
{
    /**
     * Runs a single test, printing its name, outcome and duration.
     * 
     * NOTE: a test fails by throwing (see ASSERT_THAT()).
     */
    void runTest(std::string &testName, std::function<void()> &testFunc);

    /**
     * Prints the banner shown before each test suite.
     */
    void printSuiteHeader(const std::string &suiteName);

    /* Number of tests run / failed since process start */
    int testsRun();
    int testsFailed();
};
