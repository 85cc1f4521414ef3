#include "errors.hpp"

#include <boost/system/error_code.hpp>

namespace errc = boost::system::errc;

static std::string with_cause(const std::string& what, const boost::system::error_code& cause)
{
    if(!cause)
        return what;
    return what + ": " + cause.message();
}

SpicatError::SpicatError(const std::string& what, const boost::system::error_code& cause)
    : std::runtime_error(with_cause(what, cause)), _cause(cause)
{}

OpenError::OpenError(const std::string& kind, const std::string& path, const boost::system::error_code& cause)
    : SpicatError("Failed to open " + kind + " " + path, cause), _path(path)
{}

OpenError::Reason OpenError::reason() const noexcept
{
    const boost::system::error_code& ec = cause();

    if(ec == errc::no_such_file_or_directory || ec == errc::no_such_device)
        return Reason::NotFound;
    if(ec == errc::permission_denied || ec == errc::operation_not_permitted)
        return Reason::PermissionDenied;
    if(ec == errc::device_or_resource_busy || ec == errc::operation_would_block ||
       ec == errc::resource_unavailable_try_again)
        return Reason::Busy;

    return Reason::Other;
}

ConfigurationError::ConfigurationError(const std::string& field, const std::string& value, const std::string& what,
                                       const boost::system::error_code& cause)
    : SpicatError(what, cause), _field(field), _value(value)
{}

InputReadError::InputReadError(const std::string& source, const boost::system::error_code& cause)
    : SpicatError("Failed to read input message from " + source, cause)
{}

TransferError::TransferError(const std::string& what, const boost::system::error_code& cause)
    : SpicatError(what, cause)
{}

OutputWriteError::OutputWriteError(const std::string& sink, const boost::system::error_code& cause)
    : SpicatError("Failed to write to " + sink, cause)
{}
