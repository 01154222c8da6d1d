#include <testutil/testutil_assert.h>

#include <iostream>

// Run the summary of a test program that has 'failures' failed assertions and return its exit status.
int getExitStatus(int failures)
{
    int saved = ASSERT_COUNT;
    ASSERT_COUNT = failures;
    int status = []() -> int { TESTUTIL_RETURN }();
    ASSERT_COUNT = saved;
    return status;
}

int main(int argc, char *argv[])
{
    std::cout << "The next lines are summaries of simulated runs:" << std::endl;

    ASSERT(getExitStatus(0) == 0);
    ASSERT(getExitStatus(1) == 1);
    ASSERT(getExitStatus(3) == 1);

    // A count that is a multiple of 256 must not wrap around to a passing status.
    ASSERT(getExitStatus(256) == 1);
    ASSERT(getExitStatus(512) == 1);

    int failures = ASSERT_COUNT;
    ASSERT_THROWS(throw 1, int);
    ASSERT(ASSERT_COUNT == failures);

    TESTUTIL_RETURN
}
