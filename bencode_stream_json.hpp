#ifndef BENCODE_STREAM_JSON_H
#define BENCODE_STREAM_JSON_H

#include "bencode_stream.hpp"

#include <boost/json.hpp>

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bencode_stream
{

namespace detail
{

inline bool is_ascii(const std::string_view bytes) noexcept
{
    for (const char c : bytes)
    {
        if (static_cast<unsigned char>(c) >= 0x80)
        {
            return false;
        }
    }
    return true;
}

// Standard alphabet, padded
inline std::string base64_encode(const std::string_view bytes)
{
    static constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve((bytes.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3)
    {
        const std::uint32_t triple =
            (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i])) << 16) |
            (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i + 1])) << 8) |
            static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i + 2]));
        result.push_back(alphabet[(triple >> 18) & 0x3f]);
        result.push_back(alphabet[(triple >> 12) & 0x3f]);
        result.push_back(alphabet[(triple >> 6) & 0x3f]);
        result.push_back(alphabet[triple & 0x3f]);
    }

    const std::size_t tail = bytes.size() - i;
    if (tail != 0)
    {
        std::uint32_t triple =
            static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i])) << 16;
        if (tail == 2)
        {
            triple |=
                static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i + 1])) << 8;
        }
        result.push_back(alphabet[(triple >> 18) & 0x3f]);
        result.push_back(alphabet[(triple >> 12) & 0x3f]);
        result.push_back((tail == 2) ? alphabet[(triple >> 6) & 0x3f] : '=');
        result.push_back('=');
    }

    return result;
}

} // namespace detail

// Converts a document to compact JSON text. Byte strings that are not plain
// ASCII are written as "base64:<data>"; dictionary keys must be ASCII.
class json_handler : public handler
{
private:

    std::ostream& m_out;
    std::string m_bytes;
    bool m_first = true;

    void separate()
    {
        if (!m_first)
        {
            m_out << ", ";
        }
        m_first = false;
    }

public:

    explicit json_handler(std::ostream& out) noexcept
    : m_out(out)
    {
    }

    void integer(const std::int64_t value)
    {
        m_out << value;
    }

    void list_start()
    {
        m_out << '[';
        m_first = true;
    }

    void list_value_start()
    {
        separate();
    }

    void list_end()
    {
        m_out << ']';
        // back in the parent, which has at least this element
        m_first = false;
    }

    void dict_start()
    {
        m_out << '{';
        m_first = true;
    }

    void dict_key_start()
    {
        separate();
    }

    void key(const std::string_view key)
    {
        if (!detail::is_ascii(key))
        {
            throw std::invalid_argument(
                "json_handler: dictionary key is not ASCII");
        }
        m_out << boost::json::serialize(
                     boost::json::string_view(key.data(), key.size()))
              << ": ";
    }

    void dict_end()
    {
        m_out << '}';
        m_first = false;
    }

    void string_start(std::size_t)
    {
        m_bytes.clear();
    }

    void string_chunk(const std::string_view bytes)
    {
        m_bytes.append(bytes);
    }

    void string_end()
    {
        if (detail::is_ascii(m_bytes))
        {
            m_out << boost::json::serialize(
                boost::json::string_view(m_bytes.data(), m_bytes.size()));
        }
        else
        {
            const std::string encoded = "base64:" + detail::base64_encode(m_bytes);
            m_out << boost::json::serialize(
                boost::json::string_view(encoded.data(), encoded.size()));
        }
        m_bytes.clear();
    }
}; // class json_handler

} // namespace bencode_stream

#endif // BENCODE_STREAM_JSON_H
