#pragma once

#include "http_message.hpp"
#include <mutex>
#include <string>
#include <string_view>

namespace slb {

// Keeps the first `capacity` bytes of the most recently written chunk.
class ResponseSampleBuffer {
public:
    explicit ResponseSampleBuffer(size_t capacity);

    void record(std::string_view chunk);
    std::string snapshot() const;

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::string sample_;
    mutable std::mutex mutex_;
};

// Copies outbound body bytes into a sample buffer on their way to the client.
class SamplingResponseSink : public ResponseSink {
public:
    SamplingResponseSink(ResponseSink& inner, ResponseSampleBuffer& buffer);

    void write_head(int status, const Headers& headers) override;
    void write(std::string_view chunk) override;
    boost::asio::ip::tcp::socket* hijack(std::string& buffered) override;
    void on_abort(std::function<void()> abort) override;

private:
    ResponseSink& inner_;
    ResponseSampleBuffer& buffer_;
};

} // namespace slb
