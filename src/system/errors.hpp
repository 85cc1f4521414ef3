#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>

// Base of every error reported by spicat. The message already names the
// failing operation; cause() holds the OS error when there was one.
class SpicatError : public std::runtime_error
{
public:
    explicit SpicatError(const std::string& what, const boost::system::error_code& cause = {});

    const boost::system::error_code& cause() const noexcept { return _cause; }

private:
    boost::system::error_code _cause;
};

// Invalid command line input
class UsageError : public SpicatError
{
public:
    explicit UsageError(const std::string& what) : SpicatError(what) {}
};

// A device or file could not be acquired
class OpenError : public SpicatError
{
public:
    enum class Reason
    {
        NotFound,
        PermissionDenied,
        Busy,
        Other
    };

    OpenError(const std::string& kind, const std::string& path, const boost::system::error_code& cause);

    const std::string& path() const noexcept { return _path; }
    Reason reason() const noexcept;

private:
    std::string _path;
};

// The driver refused one bus setting. Settings applied before this one stay applied.
class ConfigurationError : public SpicatError
{
public:
    ConfigurationError(const std::string& field, const std::string& value, const std::string& what,
                       const boost::system::error_code& cause);

    const std::string& field() const noexcept { return _field; }
    const std::string& value() const noexcept { return _value; }

private:
    std::string _field;
    std::string _value;
};

class InputReadError : public SpicatError
{
public:
    InputReadError(const std::string& source, const boost::system::error_code& cause);
};

class TransferError : public SpicatError
{
public:
    explicit TransferError(const std::string& what, const boost::system::error_code& cause = {});
};

class OutputWriteError : public SpicatError
{
public:
    OutputWriteError(const std::string& sink, const boost::system::error_code& cause);
};

#endif
