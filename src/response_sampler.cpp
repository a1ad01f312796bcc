#include "response_sampler.hpp"
#include <algorithm>

namespace slb {

ResponseSampleBuffer::ResponseSampleBuffer(size_t capacity)
    : capacity_(capacity) {
    sample_.reserve(capacity_);
}

void ResponseSampleBuffer::record(std::string_view chunk) {
    std::lock_guard lock(mutex_);
    sample_.assign(chunk.substr(0, std::min(chunk.size(), capacity_)));
}

std::string ResponseSampleBuffer::snapshot() const {
    std::lock_guard lock(mutex_);
    return sample_;
}

SamplingResponseSink::SamplingResponseSink(ResponseSink& inner, ResponseSampleBuffer& buffer)
    : inner_(inner), buffer_(buffer) {}

void SamplingResponseSink::write_head(int status, const Headers& headers) {
    inner_.write_head(status, headers);
}

void SamplingResponseSink::write(std::string_view chunk) {
    buffer_.record(chunk);
    inner_.write(chunk);
}

boost::asio::ip::tcp::socket* SamplingResponseSink::hijack(std::string& buffered) {
    return inner_.hijack(buffered);
}

void SamplingResponseSink::on_abort(std::function<void()> abort) {
    inner_.on_abort(std::move(abort));
}

} // namespace slb
