#include "mediagate/network/Buffer.h"

#include <cerrno>
#include <unistd.h>

namespace mediagate {
namespace network {

void Buffer::MakeSpace(size_t len) {
    const size_t readable = ReadableBytes();
    if (PrependableBytes() - kCheapPrepend + WritableBytes() >= len) {
        // Consumed bytes at the front are enough: compact instead of growing.
        std::copy(Begin() + readerIndex_, Begin() + writerIndex_, Begin() + kCheapPrepend);
        readerIndex_ = kCheapPrepend;
        writerIndex_ = kCheapPrepend + readable;
        return;
    }
    buffer_.resize(writerIndex_ + len);
}

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    EnsureWritableBytes(kMinReadSize);
    const ssize_t n = ::read(fd, BeginWrite(), WritableBytes());
    if (n < 0) {
        *savedErrno = errno;
    } else {
        HasWritten(static_cast<size_t>(n));
    }
    return n;
}

void Buffer::Shrink(size_t reserve) {
    std::vector<char> fresh(kCheapPrepend + ReadableBytes() + reserve);
    std::copy(Peek(), static_cast<const char*>(BeginWrite()), fresh.begin() + kCheapPrepend);
    writerIndex_ = kCheapPrepend + ReadableBytes();
    readerIndex_ = kCheapPrepend;
    buffer_.swap(fresh);
}

} // namespace network
} // namespace mediagate
