/**
 * @file byte_stream.hpp
 * @brief Chunked byte-stream callbacks shared by producers and consumers.
 *
 * A producer pushes chunks into a ByteSink. When the sink returns an error, the producer stops,
 * releases its resources and returns that error; when the producer fails, the consumer is
 * cancelled by its caller. Either way the first error wins.
 */

#ifndef BYTE_STREAM_HPP
#define BYTE_STREAM_HPP

#include <string>
#include <string_view>
#include <expected>
#include <functional>
#include <cstddef>

/// Receives one chunk of data; an error stops the producer.
using ByteSink = std::function<std::expected<void, std::string>(std::string_view)>;

/// Pushes all of its data into the given sink.
using ByteProducer = std::function<std::expected<void, std::string>(const ByteSink&)>;

/// Chunk size used when copying streams.
inline constexpr std::size_t kStreamChunkSize = 8192;

#endif // BYTE_STREAM_HPP
