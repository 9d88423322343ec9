// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file transport.hpp
/// @brief Byte transport and Content-Length framing for the CLI's JSON-RPC channel

#include <atomic>
#include <cstddef>
#include <hangul_ai/process.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hangul_ai
{

// =============================================================================
// Transport Exceptions
// =============================================================================

/// Exception thrown when transport operations fail
class TransportError : public std::runtime_error
{
  public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

/// Exception thrown when the peer has gone away
class ConnectionClosedError : public TransportError
{
  public:
    ConnectionClosedError() : TransportError("Connection closed") {}
    explicit ConnectionClosedError(const std::string& message) : TransportError(message) {}
};

// =============================================================================
// Transport Interface
// =============================================================================

/// Raw byte stream; framing is layered on top by MessageFramer
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Read up to `size` bytes
    /// @return Number of bytes read (0 indicates EOF)
    /// @throws TransportError on read failure
    virtual size_t read(char* buffer, size_t size) = 0;

    /// Write all bytes
    /// @throws TransportError on write failure
    virtual void write(const char* data, size_t size) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;

    void write(const std::string& data)
    {
        write(data.data(), data.size());
    }
};

// =============================================================================
// Content-Length Message Framer
// =============================================================================

/// LSP-style framing:
/// ```
/// Content-Length: <length>\r\n
/// \r\n
/// <json-rpc-message>
/// ```
/// Header names are case-insensitive; headers other than Content-Length are ignored.
class MessageFramer
{
  public:
    explicit MessageFramer(ITransport& transport) : transport_(transport) {}

    /// Read one framed message body
    /// @throws ConnectionClosedError on EOF
    /// @throws TransportError on malformed headers
    std::string read_message();

    /// Write one message with its Content-Length header
    void write_message(const std::string& message);

  private:
    /// Next header line without its line terminator
    std::string read_header_line();

    /// Copy n bytes out of the buffer, reading more as needed
    void read_body(char* out, size_t n);

    /// Read more bytes into the buffer; false on EOF
    bool refill();

    ITransport& transport_;
    std::vector<char> buffer_;
    size_t buffer_pos_ = 0;
    size_t buffer_len_ = 0;
};

/// Parse the value of a "Content-Length:" header line
/// @return nullopt if the line is some other header
/// @throws TransportError if the value is not a number
std::optional<size_t> parse_content_length(const std::string& header_line);

// =============================================================================
// PipeTransport - Transport over a child process's stdin/stdout
// =============================================================================

/// Transport that reads the child's stdout and writes its stdin
/// The pipes stay owned by the Process and must outlive this transport.
class PipeTransport : public ITransport
{
  public:
    PipeTransport(WritePipe& write_pipe, ReadPipe& read_pipe)
        : write_pipe_(&write_pipe), read_pipe_(&read_pipe), open_(true)
    {
    }

    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;

    using ITransport::write;

    size_t read(char* buffer, size_t size) override;
    void write(const char* data, size_t size) override;

    void close() override
    {
        open_ = false;
    }

    bool is_open() const override
    {
        return open_;
    }

  private:
    WritePipe* write_pipe_;
    ReadPipe* read_pipe_;
    std::atomic<bool> open_;
};

} // namespace hangul_ai
