/* @file Terminal.hh
 *
 * Licensed under the MIT License <https://opensource.org/licenses/MIT>.
 * SPDX-License-Identifier: MIT
 * Copyright (c) 2022 Zachary Parker
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is furnished to do
 * so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#ifndef __GRESS_UTIL_TERMINAL_HH__
#define __GRESS_UTIL_TERMINAL_HH__

#include <ios>
#include <iostream>
#include <string_view>

namespace gress::ui {

namespace term {

struct EraseLine { };
struct CarriageReturn { };

inline std::ostream &operator<<(std::ostream &s, const EraseLine &)
{
    return s << "\x1b[2K";
}

inline std::ostream &operator<<(std::ostream &s, const CarriageReturn &)
{
    return s << '\r';
}

}

/**
 * Append target for rendered lines.
 *
 * A sink is owned by one progress bar at a time. Drivers sharing a sink must
 * serialize their own access; output of concurrent writers interleaves.
 */
class OutputSink
{
public:
    virtual ~OutputSink() noexcept = default;

    virtual void write(std::string_view text) = 0;
    virtual void flush() = 0;
};

class StreamSink : public OutputSink
{
public:
    explicit StreamSink(std::ostream &stream = std::cout):
        stream_(&stream)
    {
    }

    void write(std::string_view text) override
    {
        *stream_ << text;

        if (stream_->bad())
            throw std::ios_base::failure("StreamSink: write failed");
    }

    void flush() override
    {
        stream_->flush();

        if (stream_->bad())
            throw std::ios_base::failure("StreamSink: flush failed");
    }

    std::ostream &stream() noexcept
    {
        return *stream_;
    }

private:
    std::ostream *stream_;
};

}

#endif
