#include <block/block_out.h>

#include <testutil/testutil_assert.h>

#include <string>

struct Progress
{
    int d_count;
    double d_ratio;
};

class Source
{
public:
    block::out<void()> out0;
    block::out<void(const char*)> out1;
    block::out<void(const char*, int)> out2;
    block::out<void(const char*, int, const char*)> out3;
    block::out<void(const char*, int, Progress)> out4;

    // not connected
    block::out<void(int, double)> out100;
    block::out<int(int, double)> out101;

    // connected to mulitple inports
    block::out<void(const int &, double)> out200;
    block::out<int(int, double)> out201;
    block::out<void(int&, double)> out202;

    void run()
    {
        out0();
        out1("Hello World");
        out2("Hello World", 1);
        out3("Hello World", 1, "file");
        Progress progress = { 3, 0.5 };
        out4("Hello World", 1, progress);
    }
};

class Sink
{
private:
    mutable int d_numCalls;
public:

    Sink()
        : d_numCalls(0)
    {
    }

    int numCalls() const { return d_numCalls; }

    std::string d_lastName;
    int d_lastCount;

    void in0()
    {
        ++d_numCalls;
    }
    void in1(const char *name) const
    {
        ++d_numCalls;
    }
    void in2(const char *name, int count)
    {
        ++d_numCalls;
        d_lastName = name;
        d_lastCount = count;
    }
    void in3(const char*, int, const char *file) const
    {
        ++d_numCalls;
    }
    void in4(const char*, int, Progress progress)
    {
        ++d_numCalls;
        d_lastCount = progress.d_count;
    }

    void in200(const int&, double)
    {
        ++d_numCalls;
    }
    int in201(int i, double)
    {
        ++d_numCalls;
        return d_numCalls * 100 + i;
    }
    void in202(int &i, double)
    {
        ++d_numCalls;
        ++i;
    }
};

int main(int argc, char *argv[])
{
    {
        Source source;
        Sink sink;

        ASSERT(!source.out0.isConnected());

        source.out0.connect(&sink, &Sink::in0);
        source.out1.connect(&sink, &Sink::in1);
        source.out2.connect(&sink, &Sink::in2);
        source.out3.connect(&sink, &Sink::in3);
        source.out4.connect(&sink, &Sink::in4);
        ASSERT(source.out0.isConnected());

        source.run();
        ASSERT(sink.numCalls() == 5);
        ASSERT(sink.d_lastName == "Hello World");
        ASSERT(sink.d_lastCount == 3);

        // Unconnected void outports do nothing; others throw.
        source.out100(1, 2.0);
        ASSERT_THROWS(source.out101(1, 2.0), block::outport_not_connected);
        ASSERT(sink.numCalls() == 5);

        // Every inport is called in order; the last one provides the return value.
        source.out200.connect(&sink, &Sink::in200);
        source.out200.connect(&sink, &Sink::in200);
        source.out200(1, 2.0);
        ASSERT(sink.numCalls() == 7);

        source.out201.connect(&sink, &Sink::in201);
        source.out201.connect(&sink, &Sink::in201);
        ASSERT(source.out201(1, 2.0) == 901);

        int i = 0;
        source.out202.connect(&sink, &Sink::in202);
        source.out202.connect(&sink, &Sink::in202);
        source.out202(i, 2.0);
        ASSERT(i == 2);

        source.out0.disconnect();
        ASSERT(!source.out0.isConnected());
        source.out0();
        ASSERT(sink.numCalls() == 11);
    }

    TESTUTIL_RETURN
}
