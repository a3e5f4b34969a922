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

#include "../bencode_stream.hpp"
#include "../bencode_stream_print.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

TEST(bencode_stream_print, dict)
{
    std::ostringstream out;
    bencode_stream::print_handler handler(out);
    bencode_stream::parse("d3:bar4:spam3:fooi42ee", handler);

    const char* const expected =
        "dict_start\n"
        "dict_key_start\n"
        "key: \"bar\"\n"
        "dict_value_start\n"
        "string_start: 4\n"
        "string_chunk: \"spam\"\n"
        "string_end\n"
        "dict_value_end\n"
        "dict_key_start\n"
        "key: \"foo\"\n"
        "dict_value_start\n"
        "integer: 42\n"
        "dict_value_end\n"
        "dict_end\n";
    ASSERT_EQ(expected, out.str());
}

TEST(bencode_stream_print, list)
{
    std::ostringstream out;
    bencode_stream::print_handler handler(out);
    bencode_stream::parse("li-1e0:e", handler);

    const char* const expected =
        "list_start\n"
        "list_value_start\n"
        "integer: -1\n"
        "list_value_end\n"
        "list_value_start\n"
        "string_start: 0\n"
        "string_end\n"
        "list_value_end\n"
        "list_end\n";
    ASSERT_EQ(expected, out.str());
}

TEST(bencode_stream_print, escapes_bytes)
{
    std::ostringstream out;
    bencode_stream::print_handler handler(out);
    bencode_stream::parse(std::string("5:a\x01" "\"\\\xff", 7), handler);

    const char* const expected =
        "string_start: 5\n"
        "string_chunk: \"a\\x01\\\"\\\\\\xff\"\n"
        "string_end\n";
    ASSERT_EQ(expected, out.str());
}

TEST(bencode_stream_print, streamed_in_chunks)
{
    std::istringstream in("l5:helloe");
    std::ostringstream out;
    bencode_stream::print_handler handler(out);
    bencode_stream::parse(in, handler, 4);

    // chunks: "l5:h" "ello" "e"
    const char* const expected =
        "list_start\n"
        "list_value_start\n"
        "string_start: 5\n"
        "string_chunk: \"h\"\n"
        "string_chunk: \"ello\"\n"
        "string_end\n"
        "list_value_end\n"
        "list_end\n";
    ASSERT_EQ(expected, out.str());
}
