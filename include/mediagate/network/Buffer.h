#pragma once

#include <algorithm>
#include <string>
#include <vector>
#include <sys/types.h> // for ssize_t

namespace mediagate {
namespace network {

/// Growable byte buffer with a cheap prepend area.
///
///   +-------------------+------------------+------------------+
///   | prependable bytes |  readable bytes  |  writable bytes  |
///   +-------------------+------------------+------------------+
///   0          <=   readerIndex   <=   writerIndex    <=    size
class Buffer {
public:
    static const size_t kCheapPrepend = 8;
    static const size_t kInitialSize = 1024;
    // ReadFd grows the buffer to at least this much free space first.
    static const size_t kMinReadSize = 16 * 1024;

    explicit Buffer(size_t initialSize = kInitialSize)
        : buffer_(kCheapPrepend + initialSize),
          readerIndex_(kCheapPrepend),
          writerIndex_(kCheapPrepend) {}

    size_t ReadableBytes() const { return writerIndex_ - readerIndex_; }
    size_t WritableBytes() const { return buffer_.size() - writerIndex_; }
    size_t PrependableBytes() const { return readerIndex_; }

    const char* Peek() const { return Begin() + readerIndex_; }

    const char* FindCRLF() const {
        static const char kCRLF[] = "\r\n";
        const char* crlf = std::search(Peek(), BeginWrite(), kCRLF, kCRLF + 2);
        return crlf == BeginWrite() ? nullptr : crlf;
    }

    void Retrieve(size_t len) {
        if (len < ReadableBytes()) {
            readerIndex_ += len;
        } else {
            RetrieveAll();
        }
    }

    void RetrieveUntil(const char* end) { Retrieve(end - Peek()); }

    void RetrieveAll() {
        readerIndex_ = kCheapPrepend;
        writerIndex_ = kCheapPrepend;
    }

    std::string RetrieveAllAsString() {
        return RetrieveAsString(ReadableBytes());
    }

    std::string RetrieveAsString(size_t len) {
        std::string result(Peek(), len);
        Retrieve(len);
        return result;
    }

    void Append(const std::string& str) {
        Append(str.data(), str.size());
    }

    void Append(const char* data, size_t len) {
        EnsureWritableBytes(len);
        std::copy(data, data + len, BeginWrite());
        HasWritten(len);
    }

    char* BeginWrite() { return Begin() + writerIndex_; }
    const char* BeginWrite() const { return Begin() + writerIndex_; }

    void HasWritten(size_t len) { writerIndex_ += len; }

    void EnsureWritableBytes(size_t len) {
        if (WritableBytes() < len) {
            MakeSpace(len);
        }
    }

    size_t Capacity() const { return buffer_.size(); }

    // One read(2) straight into the writable area. Returns its result; errno goes to *savedErrno.
    ssize_t ReadFd(int fd, int* savedErrno);

    // Drops spare capacity, keeping the readable bytes plus `reserve`.
    void Shrink(size_t reserve);

private:
    char* Begin() { return buffer_.data(); }
    const char* Begin() const { return buffer_.data(); }

    void MakeSpace(size_t len);

    std::vector<char> buffer_;
    size_t readerIndex_;
    size_t writerIndex_;
};

} // namespace network
} // namespace mediagate
