#ifndef BENCODE_STREAM_PRINT_H
#define BENCODE_STREAM_PRINT_H

#include "bencode_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace bencode_stream
{

namespace detail
{

// Writes bytes between double quotes, escaping anything not printable
inline void write_quoted_bytes(std::ostream& out, const std::string_view bytes)
{
    static constexpr char hex_digits[] = "0123456789abcdef";

    out << '"';
    for (const char c : bytes)
    {
        const auto byte = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\')
        {
            out << '\\' << c;
        }
        else if (byte >= 0x20 && byte < 0x7f)
        {
            out << c;
        }
        else
        {
            out << "\\x" << hex_digits[byte >> 4] << hex_digits[byte & 0xf];
        }
    }
    out << '"';
}

} // namespace detail

// Writes one line per event
class print_handler : public handler
{
private:

    std::ostream& m_out;

public:

    explicit print_handler(std::ostream& out) noexcept
    : m_out(out)
    {
    }

    void integer(const std::int64_t value)
    {
        m_out << "integer: " << value << '\n';
    }

    void list_start()
    {
        m_out << "list_start\n";
    }

    void list_value_start()
    {
        m_out << "list_value_start\n";
    }

    void list_value_end()
    {
        m_out << "list_value_end\n";
    }

    void list_end()
    {
        m_out << "list_end\n";
    }

    void dict_start()
    {
        m_out << "dict_start\n";
    }

    void dict_key_start()
    {
        m_out << "dict_key_start\n";
    }

    void key(const std::string_view key)
    {
        m_out << "key: ";
        detail::write_quoted_bytes(m_out, key);
        m_out << '\n';
    }

    void dict_value_start()
    {
        m_out << "dict_value_start\n";
    }

    void dict_value_end()
    {
        m_out << "dict_value_end\n";
    }

    void dict_end()
    {
        m_out << "dict_end\n";
    }

    void string_start(const std::size_t length)
    {
        m_out << "string_start: " << length << '\n';
    }

    void string_chunk(const std::string_view bytes)
    {
        m_out << "string_chunk: ";
        detail::write_quoted_bytes(m_out, bytes);
        m_out << '\n';
    }

    void string_end()
    {
        m_out << "string_end\n";
    }
}; // class print_handler

} // namespace bencode_stream

#endif // BENCODE_STREAM_PRINT_H
