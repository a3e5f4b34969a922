// Copyright (c) Giacomo Drago <giacomo@giacomodrago.com>
// All rights reserved.

// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
// 3. Neither the name of Giacomo Drago nor the
//    names of its contributors may be used to endorse or promote products
//    derived from this software without specific prior written permission.

// THIS SOFTWARE IS PROVIDED BY GIACOMO DRAGO "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
// WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL GIACOMO DRAGO BE LIABLE FOR ANY
// DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
// (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
// LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
// ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#ifndef BENCODE_STREAM_TEST_EVENT_RECORDER_H
#define BENCODE_STREAM_TEST_EVENT_RECORDER_H

#include "../bencode_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Records every event as a string such as "key(foo)" or "string_start(4)".
// Element boundary events are only recorded when boundaries is set.
struct event_recorder : bencode_stream::handler
{
    std::vector<std::string> events;
    bool boundaries = false;

    explicit event_recorder(const bool record_boundaries = false)
    : boundaries(record_boundaries)
    {
    }

    void integer(const std::int64_t value)
    {
        events.push_back("integer(" + std::to_string(value) + ")");
    }

    void list_start()
    {
        events.emplace_back("list_start");
    }

    void list_value_start()
    {
        boundary("list_value_start");
    }

    void list_value_end()
    {
        boundary("list_value_end");
    }

    void list_end()
    {
        events.emplace_back("list_end");
    }

    void dict_start()
    {
        events.emplace_back("dict_start");
    }

    void dict_key_start()
    {
        boundary("dict_key_start");
    }

    void key(const std::string_view key)
    {
        events.push_back("key(" + std::string(key) + ")");
    }

    void dict_value_start()
    {
        boundary("dict_value_start");
    }

    void dict_value_end()
    {
        boundary("dict_value_end");
    }

    void dict_end()
    {
        events.emplace_back("dict_end");
    }

    void string_start(const std::size_t length)
    {
        events.push_back("string_start(" + std::to_string(length) + ")");
    }

    void string_chunk(const std::string_view bytes)
    {
        events.push_back("string_chunk(" + std::string(bytes) + ")");
    }

    void string_end()
    {
        events.emplace_back("string_end");
    }

private:

    void boundary(const char* const name)
    {
        if (boundaries)
        {
            events.emplace_back(name);
        }
    }
};

// Joins runs of adjacent string_chunk events, so that the same document split
// at different points yields the same sequence
inline std::vector<std::string> merge_chunks(
    const std::vector<std::string>& events)
{
    static const std::string prefix = "string_chunk(";

    std::vector<std::string> result;
    bool previous_is_chunk = false;

    for (const std::string& event : events)
    {
        const bool is_chunk = event.compare(0, prefix.size(), prefix) == 0;
        if (is_chunk && previous_is_chunk)
        {
            std::string& last = result.back();
            last.pop_back(); // closing parenthesis
            last.append(event, prefix.size(), std::string::npos);
        }
        else
        {
            result.push_back(event);
        }
        previous_is_chunk = is_chunk;
    }

    return result;
}

#endif // BENCODE_STREAM_TEST_EVENT_RECORDER_H
