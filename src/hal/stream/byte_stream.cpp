#include "byte_stream.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <utility>

namespace
{

boost::system::error_code last_error()
{
    return boost::system::error_code(errno, boost::system::system_category());
}

// Standard streams are borrowed: released, not closed, on destruction
class DescriptorSource : public ByteSource
{
public:
    DescriptorSource(boost::asio::io_context& io, int fd, std::string name, bool owned)
        : _stream(io, fd), _name(std::move(name)), _owned(owned)
    {}

    ~DescriptorSource() override
    {
        if(!_owned)
            _stream.release();
    }

    std::vector<uint8_t> read_all() override
    {
        std::vector<uint8_t> data;
        boost::system::error_code ec;

        boost::asio::read(_stream, boost::asio::dynamic_buffer(data), ec);
        if(ec && ec != boost::asio::error::eof)
            throw InputReadError(_name, ec);

        if(g_verbose)
            std::cerr << "[IO] Read " << data.size() << " bytes from " << _name << std::endl;
        return data;
    }

private:
    boost::asio::posix::stream_descriptor _stream;
    std::string _name;
    bool _owned;
};

class DescriptorSink : public ByteSink
{
public:
    DescriptorSink(boost::asio::io_context& io, int fd, std::string name, bool owned)
        : _stream(io, fd), _name(std::move(name)), _owned(owned), _interactive(::isatty(fd) != 0)
    {}

    ~DescriptorSink() override
    {
        if(!_owned)
            _stream.release();
    }

    void write(const uint8_t* data, std::size_t len) override
    {
        boost::system::error_code ec;

        boost::asio::write(_stream, boost::asio::buffer(data, len), ec);
        if(ec)
            throw OutputWriteError(_name, ec);
    }

    bool is_interactive() const override { return _interactive; }

private:
    boost::asio::posix::stream_descriptor _stream;
    std::string _name;
    bool _owned;
    bool _interactive;
};

} // namespace

std::unique_ptr<ByteSource> open_source(boost::asio::io_context& io, const std::string& path)
{
    if(path == STREAM_SENTINEL)
        return std::make_unique<DescriptorSource>(io, STDIN_FILENO, "standard input", false);

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if(fd < 0)
        throw OpenError("input file", path, last_error());

    if(g_verbose)
        std::cerr << "[IO] Input file opened: " << path << std::endl;
    // The stream takes the descriptor only once it is constructed
    try
    {
        return std::make_unique<DescriptorSource>(io, fd, "input file " + path, true);
    }
    catch(...)
    {
        ::close(fd);
        throw;
    }
}

std::unique_ptr<ByteSink> open_sink(boost::asio::io_context& io, const std::string& path)
{
    if(path == STREAM_SENTINEL)
        return std::make_unique<DescriptorSink>(io, STDOUT_FILENO, "output stream", false);

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, OUTPUT_FILE_MODE);
    if(fd < 0)
        throw OpenError("output file", path, last_error());

    if(g_verbose)
        std::cerr << "[IO] Output file created: " << path << std::endl;
    // The stream takes the descriptor only once it is constructed
    try
    {
        return std::make_unique<DescriptorSink>(io, fd, "output file " + path, true);
    }
    catch(...)
    {
        ::close(fd);
        throw;
    }
}
