// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <hangul_ai/transport.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace hangul_ai
{

namespace
{

constexpr size_t kReadChunk = 4096;
constexpr const char* kContentLength = "content-length:";

} // namespace

// =============================================================================
// Header parsing
// =============================================================================

std::optional<size_t> parse_content_length(const std::string& header_line)
{
    const size_t prefix_len = std::strlen(kContentLength);
    if (header_line.size() < prefix_len)
        return std::nullopt;

    for (size_t i = 0; i < prefix_len; ++i)
    {
        auto c = static_cast<unsigned char>(header_line[i]);
        if (std::tolower(c) != kContentLength[i])
            return std::nullopt;
    }

    std::string value = header_line.substr(prefix_len);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t") + 1);

    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        }))
        throw TransportError("Invalid Content-Length value: " + value);

    try
    {
        return static_cast<size_t>(std::stoull(value));
    }
    catch (const std::out_of_range&)
    {
        throw TransportError("Invalid Content-Length value: " + value);
    }
}

// =============================================================================
// MessageFramer
// =============================================================================

std::string MessageFramer::read_message()
{
    std::optional<size_t> content_length;

    // Headers end at the first empty line
    for (std::string line = read_header_line(); !line.empty(); line = read_header_line())
    {
        if (auto length = parse_content_length(line))
            content_length = length;
    }

    if (!content_length)
        throw TransportError("Missing Content-Length header");

    std::string body(*content_length, '\0');
    read_body(body.data(), body.size());
    return body;
}

void MessageFramer::write_message(const std::string& message)
{
    transport_.write("Content-Length: " + std::to_string(message.size()) + "\r\n\r\n" + message);
}

std::string MessageFramer::read_header_line()
{
    std::string line;
    while (true)
    {
        if (buffer_pos_ == buffer_len_ && !refill())
            throw ConnectionClosedError("Connection closed while reading header");

        char c = buffer_[buffer_pos_++];
        if (c == '\n')
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }
        line.push_back(c);
    }
}

void MessageFramer::read_body(char* out, size_t n)
{
    size_t copied = 0;
    while (copied < n)
    {
        if (buffer_pos_ == buffer_len_ && !refill())
            throw ConnectionClosedError("Connection closed while reading message body");

        size_t take = std::min(n - copied, buffer_len_ - buffer_pos_);
        std::memcpy(out + copied, buffer_.data() + buffer_pos_, take);
        buffer_pos_ += take;
        copied += take;
    }
}

bool MessageFramer::refill()
{
    if (buffer_.size() < kReadChunk)
        buffer_.resize(kReadChunk);

    buffer_pos_ = 0;
    buffer_len_ = transport_.read(buffer_.data(), buffer_.size());
    return buffer_len_ > 0;
}

// =============================================================================
// PipeTransport
// =============================================================================

size_t PipeTransport::read(char* buffer, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();
    try
    {
        return read_pipe_->read(buffer, size);
    }
    catch (const ProcessError& e)
    {
        open_ = false;
        throw TransportError(e.what());
    }
}

void PipeTransport::write(const char* data, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();
    try
    {
        write_pipe_->write(data, size);
    }
    catch (const ProcessError& e)
    {
        open_ = false;
        throw ConnectionClosedError(e.what());
    }
}

} // namespace hangul_ai
