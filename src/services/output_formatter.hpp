#ifndef OUTPUT_FORMATTER_HPP
#define OUTPUT_FORMATTER_HPP

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "byte_stream.hpp"

enum class OutputFormat
{
    Raw,
    Hexadecimal,
    Decimal,
};

// "raw", "hex" / "hexadecimal", "dec" / "decimal"
std::istream& operator>>(std::istream& in, OutputFormat& format);
std::ostream& operator<<(std::ostream& out, OutputFormat format);

// An explicit format wins. Otherwise hex for a terminal and raw for anything else.
OutputFormat resolve_format(std::optional<OutputFormat> requested, bool destination_is_interactive);

// Renders one capture. Hex and decimal blocks are space separated and end with '\n'.
std::string format_capture(const std::vector<uint8_t>& rx, OutputFormat format);

// Writes one formatted block per transaction, as soon as it completes
class OutputFormatter
{
public:
    OutputFormatter(ByteSink& sink, OutputFormat format);

    void write(const std::vector<uint8_t>& rx);

    OutputFormat format() const { return _format; }

private:
    ByteSink& _sink;
    OutputFormat _format;
};

#endif
