#ifndef INCLUDED_BLOCK_OUT_H
#define INCLUDED_BLOCK_OUT_H

#include <utility>
#include <vector>

#include <cstddef>

namespace block {

// Thrown when an outport with a non-void return type is invoked before being connected.
struct outport_not_connected {};

namespace impl {

template <class Prototype>
class Inport;

// An inport is the receiving end of a connection: a bound member function of some object.
template <class RT, class... Args>
class Inport<RT(Args...)>
{
public:
    Inport() {}
    virtual ~Inport() {}

    virtual RT invoke(Args... args) const = 0;

private:
    // NOT IMPLEMENTED
    Inport(const Inport&);
    Inport& operator=(const Inport&);
};

template <class ObjectType, class MemberFunction, class RT, class... Args>
class MemberInport : public Inport<RT(Args...)>
{
public:
    MemberInport(ObjectType *object, MemberFunction memberFunction)
        : d_object(object)
        , d_memberFunction(memberFunction)
    {
    }

    virtual RT invoke(Args... args) const
    {
        return (d_object->*d_memberFunction)(std::forward<Args>(args)...);
    }

private:
    ObjectType *d_object;
    MemberFunction d_memberFunction;
};

template <class RT>
struct DefaultReturn
{
    static RT value()
    {
        throw outport_not_connected();
    }
};

// An unconnected void outport is simply a no-op.
template <>
struct DefaultReturn<void>
{
    static void value()
    {
    }
};

template <class Prototype>
class Outport;

template <class RT, class... Args>
class Outport<RT(Args...)>
{
public:
    Outport()
    {
    }

    ~Outport()
    {
        disconnect();
    }

    void disconnect()
    {
        for (std::size_t i = 0; i < d_inports.size(); ++i) {
            delete d_inports[i];
        }
        d_inports.clear();
    }

    bool isConnected() const
    {
        return !d_inports.empty();
    }

    // Connect 'memberFunction' of 'object'.  An outport may be connected more than once, in which case every
    // inport is called in the order of connection and the value returned by the last one is returned.
    template <class ObjectType, class MemberFunction>
    void connect(ObjectType *object, MemberFunction memberFunction)
    {
        d_inports.push_back(new MemberInport<ObjectType, MemberFunction, RT, Args...>(object, memberFunction));
    }

    RT operator()(Args... args) const
    {
        if (d_inports.empty()) {
            return DefaultReturn<RT>::value();
        }
        for (std::size_t i = 0; i + 1 < d_inports.size(); ++i) {
            d_inports[i]->invoke(args...);
        }
        return d_inports.back()->invoke(args...);
    }

private:
    std::vector<Inport<RT(Args...)>*> d_inports;
};

} // close namespace impl

template <class Prototype>
class out : public impl::Outport<Prototype>
{
public:
    out() {}
    ~out() {}
private:
    // NOT IMPLEMENTED
    out(const out&);
    out &operator=(const out&);
};

} // close namespace block

#endif // INCLUDED_BLOCK_OUT_H
