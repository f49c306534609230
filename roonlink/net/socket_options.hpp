#pragma once

#include <cstddef>

#include <sys/socket.h>

namespace roonlink
{

#ifdef SO_REUSEPORT
/// SO_REUSEPORT as a Boost.Asio SettableSocketOption
class ReusePort
{
public:
    explicit ReusePort(bool enabled) : _value(enabled ? 1 : 0) { }

    template <typename Protocol>
    int level(const Protocol&) const
    {
        return SOL_SOCKET;
    }

    template <typename Protocol>
    int name(const Protocol&) const
    {
        return SO_REUSEPORT;
    }

    template <typename Protocol>
    const void* data(const Protocol&) const
    {
        return &_value;
    }

    template <typename Protocol>
    std::size_t size(const Protocol&) const
    {
        return sizeof(_value);
    }

private:
    int _value;
};
#endif

} // namespace roonlink
