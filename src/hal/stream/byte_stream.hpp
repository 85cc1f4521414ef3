#ifndef BYTE_STREAM_HPP
#define BYTE_STREAM_HPP

#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Where the transmit payload comes from
class ByteSource
{
public:
    virtual ~ByteSource() = default;

    // Reads until end of stream. Throws InputReadError.
    virtual std::vector<uint8_t> read_all() = 0;
};

// Where the formatted capture goes
class ByteSink
{
public:
    virtual ~ByteSink() = default;

    // Writes all len bytes or throws OutputWriteError
    virtual void write(const uint8_t* data, std::size_t len) = 0;

    // True when the sink is a terminal
    virtual bool is_interactive() const = 0;
};

// "-" selects standard input, anything else is opened read-only
std::unique_ptr<ByteSource> open_source(boost::asio::io_context& io, const std::string& path);

// "-" selects standard output, anything else is created or truncated
std::unique_ptr<ByteSink> open_sink(boost::asio::io_context& io, const std::string& path);

#endif
