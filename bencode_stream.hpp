#ifndef BENCODE_STREAM_H
#define BENCODE_STREAM_H

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

// Zero means no limit
#ifndef BCS_NESTING_LIMIT
#define BCS_NESTING_LIMIT 0
#endif

// Zero means no limit
#ifndef BCS_KEY_LENGTH_LIMIT
#define BCS_KEY_LENGTH_LIMIT 0
#endif

namespace bencode_stream
{

class parse_error : public std::exception
{
public:

    enum error_reason
    {
        INVALID_LEADING_BYTE,
        MALFORMED_INTEGER,
        INTEGER_OUT_OF_RANGE,
        MALFORMED_LENGTH_PREFIX,
        UNMATCHED_END,
        DICT_KEY_NOT_STRING,
        DICT_KEY_ORDER_VIOLATION,
        INCOMPLETE_DOCUMENT,
        TRAILING_DATA,
        EXCEEDED_NESTING_LIMIT,
        EXCEEDED_KEY_LENGTH_LIMIT,
        ABORTED,
    };

private:

    std::size_t m_offset;
    error_reason m_reason;

public:

    explicit parse_error(
        const std::size_t offset,
        const error_reason reason) noexcept
    : m_offset(offset)
    , m_reason(reason)
    {
    }

    // Offset of the offending byte in the whole stream (not in the chunk)
    std::size_t offset() const noexcept
    {
        return m_offset;
    }

    error_reason reason() const noexcept
    {
        return m_reason;
    }

    const char* what() const noexcept override
    {
        switch (m_reason)
        {
        case INVALID_LEADING_BYTE:
            return "Invalid leading byte";
        case MALFORMED_INTEGER:
            return "Malformed integer";
        case INTEGER_OUT_OF_RANGE:
            return "Integer out of range";
        case MALFORMED_LENGTH_PREFIX:
            return "Malformed string length prefix";
        case UNMATCHED_END:
            return "Unmatched end";
        case DICT_KEY_NOT_STRING:
            return "Dictionary key is not a string";
        case DICT_KEY_ORDER_VIOLATION:
            return "Dictionary keys not in strictly increasing order";
        case INCOMPLETE_DOCUMENT:
            return "Incomplete document";
        case TRAILING_DATA:
            return "Trailing data after the top-level value";
        case EXCEEDED_NESTING_LIMIT:
            return "Exceeded nesting limit";
        case EXCEEDED_KEY_LENGTH_LIMIT:
            return "Exceeded dictionary key length limit";
        case ABORTED:
            return "Parsing aborted by an exception";
        }

        return ""; // to suppress compiler warnings -- LCOV_EXCL_LINE
    }
}; // class parse_error

// LCOV_EXCL_START
inline std::ostream& operator<<(
    std::ostream& out,
    const parse_error::error_reason reason)
{
    switch (reason)
    {
        case parse_error::INVALID_LEADING_BYTE:
            return out << "INVALID_LEADING_BYTE";
        case parse_error::MALFORMED_INTEGER:
            return out << "MALFORMED_INTEGER";
        case parse_error::INTEGER_OUT_OF_RANGE:
            return out << "INTEGER_OUT_OF_RANGE";
        case parse_error::MALFORMED_LENGTH_PREFIX:
            return out << "MALFORMED_LENGTH_PREFIX";
        case parse_error::UNMATCHED_END:
            return out << "UNMATCHED_END";
        case parse_error::DICT_KEY_NOT_STRING:
            return out << "DICT_KEY_NOT_STRING";
        case parse_error::DICT_KEY_ORDER_VIOLATION:
            return out << "DICT_KEY_ORDER_VIOLATION";
        case parse_error::INCOMPLETE_DOCUMENT:
            return out << "INCOMPLETE_DOCUMENT";
        case parse_error::TRAILING_DATA:
            return out << "TRAILING_DATA";
        case parse_error::EXCEEDED_NESTING_LIMIT:
            return out << "EXCEEDED_NESTING_LIMIT";
        case parse_error::EXCEEDED_KEY_LENGTH_LIMIT:
            return out << "EXCEEDED_KEY_LENGTH_LIMIT";
        case parse_error::ABORTED:
            return out << "ABORTED";
    }

    return out << "UNKNOWN";
}
// LCOV_EXCL_STOP

namespace detail
{

// There is an std::isdigit() but it's weird (takes an int among other things)
inline bool is_digit(const char c) noexcept
{
    switch (c)
    {
    case '0':
    case '1':
    case '2':
    case '3':
    case '4':
    case '5':
    case '6':
    case '7':
    case '8':
    case '9':
        return true;
    }

    return false;
}

// Unsigned byte-wise ordering; a proper prefix sorts before the longer key
inline bool key_less(
    const std::string_view lhs,
    const std::string_view rhs) noexcept
{
    return std::lexicographical_compare(
        lhs.begin(),
        lhs.end(),
        rhs.begin(),
        rhs.end(),
        [](const char a, const char b)
        {
            return static_cast<unsigned char>(a) <
                static_cast<unsigned char>(b);
        });
}

// Result of handing a single byte to a scalar tokenizer
enum token_status
{
    TOKEN_INCOMPLETE,
    TOKEN_COMPLETE,
    TOKEN_INVALID,
    TOKEN_OUT_OF_RANGE // well formed so far, but too large for its type
};

// Recognizes the text between 'i' and 'e'. Rejects non-canonical forms on the
// first byte that makes them so, rather than at the terminator.
class integer_tokenizer final
{
private:

    enum
    {
        SIGN_OR_FIRST_DIGIT,
        FIRST_DIGIT,
        AFTER_LEADING_ZERO,
        DIGITS
    } m_state = SIGN_OR_FIRST_DIGIT;

    std::string m_text;

public:

    token_status feed(const char c)
    {
        switch (m_state)
        {
        case SIGN_OR_FIRST_DIGIT:
            if (c == '-') // leading plus sign not allowed
            {
                m_text.push_back(c);
                m_state = FIRST_DIGIT;
                return TOKEN_INCOMPLETE;
            }
            if (c == '0')
            {
                // Zero must be the only digit, and it can't be negative
                m_text.push_back(c);
                m_state = AFTER_LEADING_ZERO;
                return TOKEN_INCOMPLETE;
            }
            [[fallthrough]];
        case FIRST_DIGIT:
            if (c != '0' && is_digit(c))
            {
                m_text.push_back(c);
                m_state = DIGITS;
                return TOKEN_INCOMPLETE;
            }
            return TOKEN_INVALID;

        case AFTER_LEADING_ZERO:
            return (c == 'e') ? TOKEN_COMPLETE : TOKEN_INVALID;

        case DIGITS:
            if (is_digit(c))
            {
                m_text.push_back(c);
                return in_range() ? TOKEN_INCOMPLETE : TOKEN_OUT_OF_RANGE;
            }
            return (c == 'e') ? TOKEN_COMPLETE : TOKEN_INVALID;
        }

        return TOKEN_INVALID; // LCOV_EXCL_LINE
    }

private:

    // Up to digits10 digits always fit; only longer values need converting
    bool in_range() const noexcept
    {
        const std::size_t digits =
            m_text.size() - (m_text.front() == '-' ? 1 : 0);
        return digits <= static_cast<std::size_t>(
                std::numeric_limits<std::int64_t>::digits10) ||
            value().has_value();
    }

public:

    // Only meaningful after feed() returned TOKEN_COMPLETE.
    // Empty if the value does not fit.
    std::optional<std::int64_t> value() const noexcept
    {
        std::int64_t result = 0;
        const char* const begin = m_text.data();
        const char* const end = m_text.data() + m_text.size();
        const auto [parse_end, error] = std::from_chars(begin, end, result);
        if (parse_end != end || error != std::errc())
        {
            return std::nullopt;
        }
        return result;
    }

    std::size_t size() const noexcept
    {
        return m_text.size();
    }

    void reset() noexcept
    {
        m_text.clear();
        m_state = SIGN_OR_FIRST_DIGIT;
    }
}; // class integer_tokenizer

// Recognizes the decimal length in front of ':'
class length_tokenizer final
{
private:

    std::string m_text;

public:

    // The leading digit has already been seen by whoever dispatched to us
    void begin(const char first_digit)
    {
        m_text.assign(1, first_digit);
    }

    token_status feed(const char c)
    {
        if (c == ':')
        {
            return TOKEN_COMPLETE;
        }

        // Only a lone '0' may start with zero
        if (!is_digit(c) || m_text == "0")
        {
            return TOKEN_INVALID;
        }

        m_text.push_back(c);
        if (m_text.size() > static_cast<std::size_t>(
                std::numeric_limits<std::size_t>::digits10) &&
            !value())
        {
            return TOKEN_OUT_OF_RANGE;
        }
        return TOKEN_INCOMPLETE;
    }

    // Empty if the length does not fit in std::size_t
    std::optional<std::size_t> value() const noexcept
    {
        std::size_t result = 0;
        const char* const begin = m_text.data();
        const char* const end = m_text.data() + m_text.size();
        const auto [parse_end, error] = std::from_chars(begin, end, result);
        if (parse_end != end || error != std::errc())
        {
            return std::nullopt;
        }
        return result;
    }

    std::size_t size() const noexcept
    {
        return m_text.size();
    }

    void reset() noexcept
    {
        m_text.clear();
    }
}; // class length_tokenizer

// Counts down the bytes of a string body. Never stores them.
class string_body final
{
private:

    std::size_t m_remaining = 0;

public:

    void begin(const std::size_t length) noexcept
    {
        m_remaining = length;
    }

    std::size_t remaining() const noexcept
    {
        return m_remaining;
    }

    bool done() const noexcept
    {
        return m_remaining == 0;
    }

    // Removes from the front of input as many bytes as the current string
    // still needs, and returns them
    std::string_view take(std::string_view& input) noexcept
    {
        const std::size_t length = std::min(m_remaining, input.size());
        const std::string_view result = input.substr(0, length);
        input.remove_prefix(length);
        m_remaining -= length;
        return result;
    }
}; // class string_body

class container_stack final
{
public:

    enum frame_kind
    {
        LIST,
        DICT
    };

private:

    struct frame
    {
        frame_kind kind;
        bool expect_key = true;
        std::optional<std::string> previous_key;
    };

    std::vector<frame> m_frames;

public:

    bool empty() const noexcept
    {
        return m_frames.empty();
    }

    std::size_t depth() const noexcept
    {
        return m_frames.size();
    }

    // The stack must not be empty
    frame_kind top_kind() const noexcept
    {
        return m_frames.back().kind;
    }

    // True if the innermost container is a dict waiting for its next key
    // (or for its closing 'e')
    bool expects_key() const noexcept
    {
        return !m_frames.empty() &&
            m_frames.back().kind == DICT &&
            m_frames.back().expect_key;
    }

    void push(const frame_kind kind)
    {
        m_frames.push_back(frame {kind, true, std::nullopt});
    }

    void pop() noexcept
    {
        m_frames.pop_back();
    }

    // Tells whether key may follow the previous key of the innermost dict
    bool key_in_order(const std::string_view key) const noexcept
    {
        const std::optional<std::string>& previous_key =
            m_frames.back().previous_key;

        return !previous_key || key_less(*previous_key, key);
    }

    // Records a validated key; the dict now waits for the matching value
    void key_done(std::string&& key) noexcept
    {
        frame& top = m_frames.back();
        top.previous_key = std::move(key);
        top.expect_key = false;
    }

    // The innermost dict got its value and waits for a key again
    void value_done() noexcept
    {
        m_frames.back().expect_key = true;
    }

    std::size_t retained_bytes() const noexcept
    {
        std::size_t result = 0;
        for (const frame& f : m_frames)
        {
            if (f.previous_key)
            {
                result += f.previous_key->size();
            }
        }
        return result;
    }
}; // class container_stack

} // namespace detail

enum parse_state
{
    AWAITING_VALUE,
    PARSING_INTEGER,
    PARSING_LENGTH_PREFIX,
    PARSING_STRING_BODY,
    COMPLETE,
    FAILED
};

struct decoder_options
{
    std::size_t max_nesting_depth = BCS_NESTING_LIMIT;
    std::size_t max_key_length = BCS_KEY_LENGTH_LIMIT;
};

// No-op implementation of every event. Derive from this and hide the methods
// you are interested in: dispatch is static, nothing here is virtual.
struct handler
{
    void integer(std::int64_t)
    {
    }

    void list_start()
    {
    }

    void list_value_start()
    {
    }

    void list_value_end()
    {
    }

    void list_end()
    {
    }

    void dict_start()
    {
    }

    void dict_key_start()
    {
    }

    // The view is only valid for the duration of the call
    void key(std::string_view)
    {
    }

    void dict_value_start()
    {
    }

    void dict_value_end()
    {
    }

    void dict_end()
    {
    }

    void string_start(std::size_t)
    {
    }

    // Never empty. The view is only valid for the duration of the call.
    void string_chunk(std::string_view)
    {
    }

    void string_end()
    {
    }
}; // struct handler

// Incremental decoder of a single bencoded value. Bytes can be fed in chunks
// of any size; events are delivered to the handler as soon as they are
// recognized.
template<typename Handler>
class decoder final
{
private:

    Handler& m_handler;
    decoder_options m_options;
    parse_state m_state = AWAITING_VALUE;
    detail::container_stack m_stack;
    detail::integer_tokenizer m_integer;
    detail::length_tokenizer m_length;
    detail::string_body m_string;
    std::string m_key_buffer;
    std::size_t m_offset = 0;
    std::optional<parse_error> m_error;

public:

    explicit decoder(
        Handler& handler,
        const decoder_options& options = decoder_options())
    : m_handler(handler)
    , m_options(options)
    {
    }

    decoder(const decoder&) = delete;
    decoder(decoder&&) = delete;
    decoder& operator=(const decoder&) = delete;
    decoder& operator=(decoder&&) = delete;

    void feed(std::string_view chunk)
    {
        throw_if_failed();

        try
        {
            while (!chunk.empty())
            {
                if (m_state == PARSING_STRING_BODY)
                {
                    consume_string_body(chunk);
                    continue;
                }

                const char c = chunk.front();
                chunk.remove_prefix(1);
                consume_byte(c);
                ++m_offset;
            }
        }
        catch (...)
        {
            // Something other than the grammar (the handler, an allocation)
            // threw: the state is unreliable from now on
            if (m_state != FAILED)
            {
                m_state = FAILED;
                m_error.emplace(m_offset, parse_error::ABORTED);
            }
            throw;
        }
    }

    void finish()
    {
        throw_if_failed();

        if (m_state != COMPLETE)
        {
            fail(parse_error::INCOMPLETE_DOCUMENT);
        }
    }

    parse_state state() const noexcept
    {
        return m_state;
    }

    bool complete() const noexcept
    {
        return m_state == COMPLETE;
    }

    bool failed() const noexcept
    {
        return m_state == FAILED;
    }

    // Number of bytes consumed so far
    std::size_t offset() const noexcept
    {
        return m_offset;
    }

    std::size_t nesting_depth() const noexcept
    {
        return m_stack.depth();
    }

    // Bytes held in the accumulators, the key buffer and the previous keys
    // of the open dicts. String values are never counted: they are not kept.
    std::size_t retained_bytes() const noexcept
    {
        return m_integer.size() +
            m_length.size() +
            m_key_buffer.size() +
            m_stack.retained_bytes();
    }

private:

    [[noreturn]] void fail(const parse_error::error_reason reason)
    {
        m_state = FAILED;
        m_error.emplace(m_offset, reason);
        throw *m_error;
    }

    void throw_if_failed() const
    {
        if (m_state == FAILED)
        {
            throw *m_error;
        }
    }

    void consume_byte(const char c)
    {
        switch (m_state)
        {
        case AWAITING_VALUE:
            begin_value(c);
            break;

        case PARSING_INTEGER:
            switch (m_integer.feed(c))
            {
            case detail::TOKEN_INCOMPLETE:
                break;
            case detail::TOKEN_COMPLETE:
                end_integer();
                break;
            case detail::TOKEN_INVALID:
                fail(parse_error::MALFORMED_INTEGER);
            case detail::TOKEN_OUT_OF_RANGE:
                fail(parse_error::INTEGER_OUT_OF_RANGE);
            }
            break;

        case PARSING_LENGTH_PREFIX:
            switch (m_length.feed(c))
            {
            case detail::TOKEN_INCOMPLETE:
                break;
            case detail::TOKEN_COMPLETE:
                end_length_prefix();
                break;
            case detail::TOKEN_INVALID:
            case detail::TOKEN_OUT_OF_RANGE:
                fail(parse_error::MALFORMED_LENGTH_PREFIX);
            }
            break;

        case COMPLETE:
            fail(parse_error::TRAILING_DATA);

        // LCOV_EXCL_START
        case PARSING_STRING_BODY:
        case FAILED:
            throw std::runtime_error(
                "[bencode_stream] this line should never be reached, "
                "please file a bug report");
        // LCOV_EXCL_STOP
        }
    }

    void begin_value(const char c)
    {
        switch (c)
        {
        case 'e':
            end_container();
            return;

        case 'i':
        case 'l':
        case 'd':
            if (m_stack.expects_key())
            {
                fail(parse_error::DICT_KEY_NOT_STRING);
            }
            if (c != 'i' &&
                m_options.max_nesting_depth != 0 &&
                m_stack.depth() >= m_options.max_nesting_depth)
            {
                fail(parse_error::EXCEEDED_NESTING_LIMIT);
            }
            break;

        default:
            if (!detail::is_digit(c))
            {
                fail(parse_error::INVALID_LEADING_BYTE);
            }
            break;
        }

        if (!m_stack.empty())
        {
            if (m_stack.top_kind() == detail::container_stack::LIST)
            {
                m_handler.list_value_start();
            }
            else if (m_stack.expects_key())
            {
                m_handler.dict_key_start();
            }
            else
            {
                m_handler.dict_value_start();
            }
        }

        switch (c)
        {
        case 'i':
            m_integer.reset();
            m_state = PARSING_INTEGER;
            break;

        case 'l':
            m_stack.push(detail::container_stack::LIST);
            m_handler.list_start();
            break;

        case 'd':
            m_stack.push(detail::container_stack::DICT);
            m_handler.dict_start();
            break;

        default:
            m_length.begin(c);
            m_state = PARSING_LENGTH_PREFIX;
            break;
        }
    }

    void end_container()
    {
        if (m_stack.empty())
        {
            fail(parse_error::UNMATCHED_END);
        }

        if (m_stack.top_kind() == detail::container_stack::LIST)
        {
            m_stack.pop();
            m_handler.list_end();
        }
        else
        {
            // A key without its value
            if (!m_stack.expects_key())
            {
                fail(parse_error::UNMATCHED_END);
            }
            m_stack.pop();
            m_handler.dict_end();
        }

        end_value();
    }

    // Called whenever a value (not a key) is complete, container or scalar
    void end_value()
    {
        if (m_stack.empty())
        {
            m_state = COMPLETE;
            return;
        }

        m_state = AWAITING_VALUE;

        if (m_stack.top_kind() == detail::container_stack::LIST)
        {
            m_handler.list_value_end();
        }
        else
        {
            m_stack.value_done();
            m_handler.dict_value_end();
        }
    }

    void end_integer()
    {
        const std::optional<std::int64_t> value = m_integer.value();
        if (!value)
        {
            fail(parse_error::INTEGER_OUT_OF_RANGE); // LCOV_EXCL_LINE
        }
        m_integer.reset();

        m_handler.integer(*value);
        end_value();
    }

    void end_length_prefix()
    {
        const std::optional<std::size_t> length = m_length.value();
        if (!length)
        {
            fail(parse_error::MALFORMED_LENGTH_PREFIX); // LCOV_EXCL_LINE
        }
        m_length.reset();

        if (m_stack.expects_key())
        {
            if (m_options.max_key_length != 0 &&
                *length > m_options.max_key_length)
            {
                fail(parse_error::EXCEEDED_KEY_LENGTH_LIMIT);
            }
        }
        else
        {
            m_handler.string_start(*length);
        }

        m_string.begin(*length);
        m_state = PARSING_STRING_BODY;

        if (m_string.done())
        {
            end_string();
        }
    }

    void consume_string_body(std::string_view& chunk)
    {
        const std::string_view bytes = m_string.take(chunk);

        // Errors raised below point at the last byte taken
        m_offset += bytes.size() - 1;

        if (m_stack.expects_key())
        {
            m_key_buffer.append(bytes);
        }
        else
        {
            m_handler.string_chunk(bytes);
        }

        if (m_string.done())
        {
            end_string();
        }

        ++m_offset;
    }

    void end_string()
    {
        if (!m_stack.expects_key())
        {
            m_handler.string_end();
            end_value();
            return;
        }

        // Reported at the key's last byte, or at the ':' for an empty key
        if (!m_stack.key_in_order(m_key_buffer))
        {
            fail(parse_error::DICT_KEY_ORDER_VIOLATION);
        }

        m_handler.key(m_key_buffer);
        m_stack.key_done(std::move(m_key_buffer));
        m_key_buffer.clear();
        m_state = AWAITING_VALUE;
    }
}; // class decoder

// Decodes a document that is entirely in memory
template<typename Handler>
void parse(
    const std::string_view document,
    Handler& handler,
    const decoder_options& options = decoder_options())
{
    decoder<Handler> decoder(handler, options);
    decoder.feed(document);
    decoder.finish();
}

// Decodes a stream, feeding the decoder chunk_size bytes at a time
template<typename Handler>
void parse(
    std::istream& stream,
    Handler& handler,
    const std::size_t chunk_size = 1024,
    const decoder_options& options = decoder_options())
{
    if (chunk_size == 0)
    {
        throw std::invalid_argument("parse(): chunk_size must be positive");
    }

    decoder<Handler> decoder(handler, options);
    std::vector<char> buffer(chunk_size);

    while (stream)
    {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize count = stream.gcount();
        if (count > 0)
        {
            decoder.feed(
                std::string_view(
                    buffer.data(),
                    static_cast<std::size_t>(count)));
        }
    }

    if (stream.bad())
    {
        throw std::runtime_error("parse(): error reading from stream");
    }

    decoder.finish();
}

} // namespace bencode_stream

#endif // BENCODE_STREAM_H
