#include "output_formatter.hpp"

#include <cstdio>
#include <istream>
#include <ostream>

std::istream& operator>>(std::istream& in, OutputFormat& format)
{
    std::string token;
    in >> token;

    if(token == "raw")
        format = OutputFormat::Raw;
    else if(token == "hex" || token == "hexadecimal")
        format = OutputFormat::Hexadecimal;
    else if(token == "dec" || token == "decimal")
        format = OutputFormat::Decimal;
    else
        in.setstate(std::ios_base::failbit);

    return in;
}

std::ostream& operator<<(std::ostream& out, OutputFormat format)
{
    switch(format)
    {
    case OutputFormat::Raw:
        return out << "raw";
    case OutputFormat::Hexadecimal:
        return out << "hex";
    case OutputFormat::Decimal:
        return out << "dec";
    }
    return out;
}

OutputFormat resolve_format(std::optional<OutputFormat> requested, bool destination_is_interactive)
{
    if(requested)
        return *requested;

    return destination_is_interactive ? OutputFormat::Hexadecimal : OutputFormat::Raw;
}

std::string format_capture(const std::vector<uint8_t>& rx, OutputFormat format)
{
    if(format == OutputFormat::Raw)
        return std::string(rx.begin(), rx.end());

    const char* pattern = (format == OutputFormat::Hexadecimal) ? "%02X" : "%u";

    std::string text;
    text.reserve(rx.size() * 4 + 1);

    char digits[4];
    for(std::size_t i = 0; i < rx.size(); i++)
    {
        if(i != 0)
            text += ' ';
        std::snprintf(digits, sizeof(digits), pattern, static_cast<unsigned>(rx[i]));
        text += digits;
    }
    text += '\n';

    return text;
}

OutputFormatter::OutputFormatter(ByteSink& sink, OutputFormat format) : _sink(sink), _format(format) {}

void OutputFormatter::write(const std::vector<uint8_t>& rx)
{
    if(_format == OutputFormat::Raw)
    {
        _sink.write(rx.data(), rx.size());
        return;
    }

    std::string block = format_capture(rx, _format);
    _sink.write(reinterpret_cast<const uint8_t*>(block.data()), block.size());
}
