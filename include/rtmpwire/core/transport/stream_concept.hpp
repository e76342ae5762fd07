/*
===============================================================================
ByteStreamConcept
===============================================================================

Minimal contract of the reliable, ordered byte stream the pipeline runs on
(a TCP socket in production, an in-memory stream in tests).

  read(buf, n)   -> bytes read (> 0), 0 on orderly end of stream, < 0 on failure
                    May return fewer than n bytes.
  write(buf, n)  -> bytes written (> 0), < 0 on failure
                    May write fewer than n bytes.
  close()        -> idempotent; must unblock a read() or write() blocked in
                    another thread

-------------------------------------------------------------------------------
Threading Model
-------------------------------------------------------------------------------

The receive loop is the only reader and the send loop the only writer.
close() may be invoked from any thread, concurrently with both.

===============================================================================
*/
#pragma once

#include <cstddef>
#include <concepts>


namespace rtmpwire::core::transport {

template<class S>
concept ByteReader =
    requires(S s, char* buf, std::size_t n)
{
    { s.read(buf, n) } noexcept -> std::same_as<std::ptrdiff_t>;
};

template<class S>
concept ByteWriter =
    requires(S s, const char* buf, std::size_t n)
{
    { s.write(buf, n) } noexcept -> std::same_as<std::ptrdiff_t>;
};

template<class S>
concept ByteStreamConcept =
    ByteReader<S> &&
    ByteWriter<S> &&
    requires(S s)
{
    { s.close() } noexcept -> std::same_as<void>;
};

} // namespace rtmpwire::core::transport
