#ifndef TESTUTIL_ASSERT
#define TESTUTIL_ASSERT

#include <iostream>
#include <cstdlib>
#include <ctime>

//============================================================================
//                         Standard Test Macros
//============================================================================

unsigned int testutil_seed = 0;
static int ASSERT_COUNT = 0;
static void TESTUTIL_ASSERT_FUNCT(int c, const char *msg, const char *file, int line)
{
    if (c) {
        std::cout << "[" << testutil_seed << "] Error " << file
                  << "(" << line << "): " << msg
                  << "    (failed)" << std::endl;
        ++ASSERT_COUNT;
    }
}
#define ASSERT(X) { TESTUTIL_ASSERT_FUNCT(!(X), #X, __FILE__, __LINE__); }

// Assert that executing 'STATEMENT' throws an exception of type 'EXCEPTION'.
#define ASSERT_THROWS(STATEMENT, EXCEPTION)                                     \
{                                                                                \
    bool testutil_thrown = false;                                                \
    try {                                                                        \
        STATEMENT;                                                               \
    } catch (EXCEPTION &) {                                                      \
        testutil_thrown = true;                                                  \
    }                                                                            \
    TESTUTIL_ASSERT_FUNCT(!testutil_thrown, #STATEMENT " throws " #EXCEPTION,   \
                          __FILE__, __LINE__);                                   \
}

#define TESTUTIL_INIT_RAND                                           \
{                                                                    \
    testutil_seed = static_cast<unsigned int>(std::time(0));         \
    std::srand(testutil_seed);                                       \
}

// Print a one-line summary with the number of failed assertions and return 1 if any assertion failed.
#define TESTUTIL_RETURN                                                          \
{                                                                                \
    std::cout << (ASSERT_COUNT ? "FAILED: " : "PASSED: ") << __FILE__;          \
    if (ASSERT_COUNT) {                                                          \
        std::cout << " (" << ASSERT_COUNT << " assertion(s))";                  \
    }                                                                            \
    std::cout << std::endl;                                                      \
    return ASSERT_COUNT ? 1 : 0;                                                 \
}

#endif // TESTUTIL_ASSERT
